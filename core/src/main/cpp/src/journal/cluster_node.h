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
#include <cstddef>
#include <functional>
#include "journal.h"
#include "journal_config.h"
#include "../persistence/persistence_manager.h"
#include "../state/workspace.h"

namespace burrow {
    namespace journal {

        /**
         * One member of a cluster sharing a journal.
         *
         * commit() runs lock, prepare, local persist, append and unlock as
         * one sequence. When the append fails the bundles touched by the
         * local persist are put back to their state before it, and a journal
         * failure retries the whole sequence up to max_commit_attempts,
         * preparing the change set again after the lock-time sync. Any other
         * failure unlocks and propagates at once.
         *
         * Records appended by other members are applied to the local
         * persistence manager during every lock and on sync(); the listener
         * then sees each applied change set, typically to forward it to
         * Workspace::external_update().
         */
        class ClusterNode : public state::ChangeSetCommitter {
        public:
            typedef std::function<void(const persist::ChangeSet&)> Listener;

            ClusterNode(Journal& journal, persist::PersistenceManager& pm,
                        const ClusterConfig& config = ClusterConfig());

            void set_listener(const Listener& listener) { listener_ = listener; }

            void commit(const std::function<void(persist::ChangeSet&)>& prepare) override;

            // Applies records other members appended since the last sync
            void sync();

            size_t records_applied() const { return applied_; }
            Journal& journal() { return journal_; }

        private:
            void consume(const Record& record);
            void apply(const persist::ChangeSet& changes);

            // Current stored state of everything changes touches
            persist::ChangeSet capture_before_images(const persist::ChangeSet& changes);
            void restore(persist::ChangeSet& before);
            void backoff(int attempt);

            Journal& journal_;
            persist::PersistenceManager& pm_;
            ClusterConfig config_;
            Listener listener_;
            size_t applied_ = 0;
        };

    }
}
