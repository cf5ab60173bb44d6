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
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <boost/thread/recursive_mutex.hpp>
#include "change_log.h"
#include "hierarchy_entry.h"
#include "state_config.h"
#include "../persistence/persistence_manager.h"

namespace burrow {
    namespace state {

        /**
         * Writes the change set of a save somewhere other than straight into
         * the persistence manager, e.g. through the cluster journal.
         *
         * prepare fills an empty change set and may throw to abort the
         * commit. Implementations call it inside whatever critical section
         * guards the store, once per attempt when they retry.
         */
        class ChangeSetCommitter {
        public:
            virtual ~ChangeSetCommitter() = default;
            virtual void commit(const std::function<void(persist::ChangeSet&)>& prepare) = 0;
        };

        /**
         * Item states of one session over a persistence manager.
         *
         * Nodes are loaded on first access together with all of their
         * properties. Edits go through the ChangeLog passed to each call and
         * become durable with save(). Entries marked for reload are reloaded
         * transparently the next time they are looked up.
         */
        class Workspace {
        public:
            explicit Workspace(persist::PersistenceManager& pm, const StateConfig& config = StateConfig());

            Workspace(const Workspace&) = delete;
            Workspace& operator=(const Workspace&) = delete;

            void set_committer(ChangeSetCommitter* c) { committer_ = c; }

            const StateConfig& config() const { return config_; }

            // Creates the root bundle if absent and returns the root state
            NodeState& ensure_root(const persist::NodeId& root_id, const std::string& node_type);

            // Throws NoSuchItemStateError when the item does not exist
            NodeState& get_node(const persist::NodeId& id);
            PropertyState& get_property(const persist::PropertyId& id);

            bool has_node(const persist::NodeId& id);

            NodeState& add_node(ChangeLog& log, const persist::NodeId& parent, const std::string& name,
                                const std::string& node_type,
                                const persist::NodeId& id = persist::NodeId::random());

            PropertyState& add_property(ChangeLog& log, const persist::NodeId& parent, const std::string& name,
                                        persist::PropertyType type,
                                        const std::vector<persist::InternalValue>& values,
                                        bool multi_valued = false);

            void set_value(ChangeLog& log, const persist::PropertyId& id, persist::PropertyType type,
                           const std::vector<persist::InternalValue>& values);

            void set_mixins(ChangeLog& log, const persist::NodeId& id, const std::set<std::string>& mixins);

            // Removes a property, or a node with its whole subtree
            void remove(ChangeLog& log, const persist::ItemId& id);

            void move(ChangeLog& log, const persist::NodeId& id, const persist::NodeId& dest_parent,
                      const std::string& dest_name);

            /**
             * Persists the changes collected in log.
             *
             * Throws StaleItemStateError when a changed item was modified or
             * destroyed by someone else since it was loaded; the stale states
             * are reverted and must be reloaded. Any failure undoes the log
             * before the error propagates. An empty log is left untouched.
             */
            void save(ChangeLog& log);

            // Invalidates every unmodified entry
            void refresh();

            /**
             * Applies changes committed elsewhere. Unmodified entries are
             * invalidated (or removed for deleted nodes); entries with pending
             * changes become STALE_MODIFIED or STALE_DESTROYED.
             */
            void external_update(const persist::ChangeSet& changes);

            EntryTable& entries() { return table_; }

        private:
            struct SaveScope {
                bool stale = false;
                std::set<persist::NodeId> modified;
                std::set<persist::NodeId> deleted;
                std::map<persist::NodeId, std::unique_ptr<persist::NodePropBundle>> persisted;
            };

            NodeState& load_node(const persist::NodeId& id);
            void reload_node(HierarchyEntry& entry);
            HierarchyEntry* live_entry(const persist::ItemId& id) const;

            void collect_subtree(NodeState& node, std::vector<ItemState*>& out);

            SaveScope collect_scope(const ChangeLog& log);
            void check_stale(SaveScope& scope);
            void build_change_set(const ChangeLog& log, SaveScope& scope, persist::ChangeSet& changes);
            void collect_reference_changes(const ChangeLog& log, persist::ChangeSet& changes);
            persist::NodePropBundle to_bundle(const NodeState& node, const persist::NodePropBundle* old);

            using ModCounts = std::vector<std::pair<persist::ItemId, uint16_t>>;
            static ModCounts mod_counts_of(const persist::ChangeSet& changes);
            void apply_mod_counts(const ModCounts& counts);

            void mark_external(HierarchyEntry& entry, bool destroyed);
            void mark_node_external(const persist::NodeId& id, bool destroyed);

            persist::PersistenceManager& pm_;
            StateConfig config_;
            ChangeSetCommitter* committer_ = nullptr;
            EntryTable table_;
            mutable boost::recursive_mutex mutex_;
        };

    }
}
