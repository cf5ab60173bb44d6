/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Burrow project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <memory>
#include <vector>
#include "node_prop_bundle.h"

namespace burrow {
    namespace persist {

        /**
         * Physical changes of one save: the unit handed to the persistence
         * manager and, in a cluster, to the journal.
         */
        struct ChangeSet {
            std::vector<NodePropBundle> modified;
            std::vector<NodeId> deleted;
            std::vector<NodeReferences> modified_refs;
            std::vector<NodeId> deleted_refs;

            bool empty() const {
                return modified.empty() && deleted.empty() &&
                       modified_refs.empty() && deleted_refs.empty();
            }
        };

        /**
         * Abstract interface for bundle persistence.
         *
         * Lifecycle: init() once, then any number of operations, then close().
         * Calling an operation outside init/close, initializing twice or
         * closing twice throws InvalidItemStateError.
         *
         * load() returns nullptr for an absent bundle. Destroying an absent
         * bundle or references record throws NoSuchItemStateError; every
         * other storage failure is an ItemStateError.
         */
        class PersistenceManager {
        public:
            virtual ~PersistenceManager() = default;

            virtual void init() = 0;
            virtual void close() = 0;

            virtual std::unique_ptr<NodePropBundle> load(const NodeId& id) = 0;
            virtual void store(NodePropBundle& bundle) = 0;
            virtual void destroy(const NodeId& id) = 0;
            virtual bool exists(const NodeId& id) = 0;

            void destroy(const NodePropBundle& bundle) { destroy(bundle.id()); }

            // Throws NoSuchItemStateError when no record exists for target
            virtual NodeReferences load_references(const NodeId& target) = 0;
            virtual void store_references(const NodeReferences& refs) = 0;
            virtual void destroy_references(const NodeId& target) = 0;
            virtual bool exists_references(const NodeId& target) = 0;

            // Applies a whole change set under one hold of the manager lock
            virtual void store(ChangeSet& changes) = 0;
        };

    }
}
