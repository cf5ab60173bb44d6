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
#include <set>
#include <string>
#include <vector>
#include "hierarchy_entry.h"

namespace burrow {
    namespace state {

        /**
         * A reversible edit. Each operation applies its edit when it is
         * created (the static create functions) and remembers the states it
         * touched; a change log later calls exactly one of persisted() or
         * undo(). The default undo reverts every touched state to its
         * snapshot, newest first.
         */
        class Operation {
        public:
            virtual ~Operation() = default;

            virtual const char* name() const = 0;

            // Bookkeeping after the change was written
            virtual void persisted() {}

            // Reverses the edit; the change log reverts whatever remains modified
            virtual void undo();

            const std::vector<ItemState*>& affected_states() const { return affected_; }

        protected:
            void add_affected(ItemState* s);

            std::vector<ItemState*> affected_;
        };

        class AddNode final : public Operation {
        public:
            // Adds a NEW node below parent and registers its entry in table
            static std::unique_ptr<AddNode> create(EntryTable& table, NodeState& parent,
                                                   const std::string& name, const persist::NodeId& id,
                                                   const std::string& node_type);

            const char* name() const override { return "AddNode"; }
            void persisted() override;

            NodeState& parent() const { return parent_; }
            NodeState& child() const { return *child_; }

        private:
            AddNode(NodeState& parent, NodeState* child);

            NodeState& parent_;
            NodeState* child_;      // owned by its hierarchy entry
        };

        class AddProperty final : public Operation {
        public:
            static std::unique_ptr<AddProperty> create(EntryTable& table, NodeState& parent,
                                                       const std::string& name, persist::PropertyType type,
                                                       const std::vector<persist::InternalValue>& values,
                                                       bool multi_valued);

            const char* name() const override { return "AddProperty"; }
            void persisted() override;

            PropertyState& property() const { return *property_; }

        private:
            AddProperty(NodeState& parent, PropertyState* property);

            NodeState& parent_;
            PropertyState* property_;
        };

        class SetPropertyValue final : public Operation {
        public:
            static std::unique_ptr<SetPropertyValue> create(PropertyState& property, persist::PropertyType type,
                                                            const std::vector<persist::InternalValue>& values);

            const char* name() const override { return "SetPropertyValue"; }

        private:
            explicit SetPropertyValue(PropertyState& property);
        };

        /**
         * Replaces the mixin set of a node. A changed mixin set can alter the
         * node's effective definition, so the node is reloaded after commit.
         */
        class SetMixin final : public Operation {
        public:
            static std::unique_ptr<SetMixin> create(NodeState& node, const std::set<std::string>& mixins);

            const char* name() const override { return "SetMixin"; }
            void persisted() override;

            NodeState& node() const { return node_; }

        private:
            explicit SetMixin(NodeState& node);

            NodeState& node_;
        };

        /**
         * Removes an item. descendants lists the states below a removed node
         * (child nodes and all properties, depth first) which are removed
         * with it. A NEW item is discarded on the spot.
         */
        class Remove final : public Operation {
        public:
            static std::unique_ptr<Remove> create(ItemState& target, NodeState& parent,
                                                  const std::vector<ItemState*>& descendants);

            const char* name() const override { return "Remove"; }

            ItemState& target() const { return target_; }

        private:
            Remove(ItemState& target, NodeState& parent);

            ItemState& target_;
        };

        /**
         * Moves a node below another parent under a new name. The node keeps
         * its id.
         */
        class Move final : public Operation {
        public:
            static std::unique_ptr<Move> create(NodeState& node, NodeState& src_parent, NodeState& dest_parent,
                                                const std::string& dest_name);

            const char* name() const override { return "Move"; }

        private:
            Move(NodeState& node, NodeState& src_parent, NodeState& dest_parent);
        };

    }
}
