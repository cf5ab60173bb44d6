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
#include <map>
#include <memory>
#include <vector>
#include "item_state.h"

namespace burrow {
    namespace state {

        class EntryTable;

        /**
         * Stable locator of one node or property. Owns the item state and
         * the last-known-good snapshot taken before its first edit.
         *
         * Links to parent and children are item ids resolved through the
         * owning EntryTable, never pointers.
         */
        class HierarchyEntry {
        public:
            HierarchyEntry(EntryTable& table, std::unique_ptr<ItemState> state);

            HierarchyEntry(const HierarchyEntry&) = delete;
            HierarchyEntry& operator=(const HierarchyEntry&) = delete;

            const persist::ItemId& id() const { return id_; }
            bool denotes_node() const { return id_.is_node(); }

            ItemState* state() const { return state_.get(); }
            NodeState* node_state() const;
            PropertyState* property_state() const;

            // Keeps a copy of the current attributes unless one is held already
            void snapshot();
            bool has_snapshot() const { return snapshot_ != nullptr; }
            const ItemState* snapshot_state() const { return snapshot_.get(); }

            /**
             * Returns to the last-known-good attributes. A NEW state is
             * discarded (REMOVED), a stale state is restored and then
             * invalidated, any other state returns to EXISTING. The state
             * object is updated in place so outstanding pointers stay valid.
             */
            void revert();

            // Accepts the current attributes as persisted
            void commit() { snapshot_.reset(); }

            // Marks the state for reload; recursive descends into children and properties
            void invalidate(bool recursive);

            // The item no longer exists; the entry stays until the table purges it
            void remove();

            // Replaces the attributes with freshly loaded ones and clears the reload flag
            void reload(const ItemState& fresh);

            bool needs_reload() const { return reload_pending_; }
            void set_needs_reload(bool r) { reload_pending_ = r; }

        private:
            EntryTable& table_;
            persist::ItemId id_;
            std::unique_ptr<ItemState> state_;
            std::unique_ptr<ItemState> snapshot_;
            bool reload_pending_ = false;
        };

        /**
         * Arena of hierarchy entries keyed by item id.
         */
        class EntryTable {
        public:
            HierarchyEntry* get(const persist::ItemId& id) const;

            // Throws InvalidItemStateError if an entry for the id already exists
            HierarchyEntry& add(std::unique_ptr<ItemState> state);

            // Property entries of node that are currently loaded
            std::vector<HierarchyEntry*> property_entries(const persist::NodeId& node) const;

            std::vector<HierarchyEntry*> all() const;

            // Drops entries whose state is REMOVED; returns how many
            size_t purge_removed();

            void clear() {
                entries_.clear();
                graveyard_.clear();
            }
            size_t size() const { return entries_.size(); }

        private:
            std::map<persist::ItemId, std::unique_ptr<HierarchyEntry>> entries_;
            std::vector<std::unique_ptr<HierarchyEntry>> graveyard_;
        };

    }
}
