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

#include "hierarchy_entry.h"
#include "../errors.h"
#include "../util/log.h"

namespace burrow {
    namespace state {

        using persist::ItemId;
        using persist::NodeId;

        HierarchyEntry::HierarchyEntry(EntryTable& table, std::unique_ptr<ItemState> state)
            : table_(table), id_(state->item_id()), state_(std::move(state)) {
            state_->entry_ = this;
        }

        NodeState* HierarchyEntry::node_state() const {
            return denotes_node() ? static_cast<NodeState*>(state_.get()) : nullptr;
        }

        PropertyState* HierarchyEntry::property_state() const {
            return denotes_node() ? nullptr : static_cast<PropertyState*>(state_.get());
        }

        void HierarchyEntry::snapshot() {
            if (!snapshot_) {
                snapshot_ = state_->clone();
            }
        }

        void HierarchyEntry::revert() {
            const Status s = state_->get_status();
            if (s == Status::NEW) {
                state_->force_status(Status::REMOVED);
                snapshot_.reset();
                return;
            }
            if (s == Status::REMOVED) {
                return;
            }

            if (snapshot_) {
                state_->copy_from(*snapshot_);
                snapshot_.reset();
            }

            if (is_stale(s)) {
                state_->force_status(Status::INVALIDATED);
                reload_pending_ = true;
            } else if (s != Status::INVALIDATED) {
                state_->force_status(Status::EXISTING);
            }
        }

        void HierarchyEntry::invalidate(bool recursive) {
            const Status s = state_->get_status();
            if (s == Status::EXISTING || s == Status::INVALIDATED) {
                state_->force_status(Status::INVALIDATED);
                reload_pending_ = true;
            } else {
                // pending changes keep their status; reload happens once they are resolved
                reload_pending_ = s != Status::NEW && s != Status::REMOVED;
            }

            if (!recursive || !denotes_node()) {
                return;
            }
            NodeState* node = node_state();
            for (const auto& c : node->child_entries()) {
                if (HierarchyEntry* child = table_.get(ItemId(c.id))) {
                    child->invalidate(true);
                }
            }
            for (HierarchyEntry* p : table_.property_entries(node->id())) {
                p->invalidate(false);
            }
        }

        void HierarchyEntry::remove() {
            state_->force_status(Status::REMOVED);
            snapshot_.reset();
            reload_pending_ = false;
        }

        void HierarchyEntry::reload(const ItemState& fresh) {
            state_->copy_from(fresh);
            state_->force_status(Status::EXISTING);
            snapshot_.reset();
            reload_pending_ = false;
        }

        // EntryTable

        HierarchyEntry* EntryTable::get(const ItemId& id) const {
            auto it = entries_.find(id);
            return it == entries_.end() ? nullptr : it->second.get();
        }

        HierarchyEntry& EntryTable::add(std::unique_ptr<ItemState> state) {
            ItemId id = state->item_id();
            auto it = entries_.find(id);
            if (it != entries_.end()) {
                if (it->second->state()->get_status() != Status::REMOVED) {
                    throw InvalidItemStateError("entry for " + id.to_string() + " already exists");
                }
                // a re-created item replaces the removed entry; the old one may
                // still be referenced by a change log until the next purge
                graveyard_.push_back(std::move(it->second));
                entries_.erase(it);
            }
            auto e = std::make_unique<HierarchyEntry>(*this, std::move(state));
            HierarchyEntry& ref = *e;
            entries_.emplace(id, std::move(e));
            return ref;
        }

        std::vector<HierarchyEntry*> EntryTable::property_entries(const NodeId& node) const {
            std::vector<HierarchyEntry*> out;
            // property ids sort right after their node id
            for (auto it = entries_.upper_bound(ItemId(node)); it != entries_.end() && it->first.node == node; ++it) {
                out.push_back(it->second.get());
            }
            return out;
        }

        std::vector<HierarchyEntry*> EntryTable::all() const {
            std::vector<HierarchyEntry*> out;
            out.reserve(entries_.size());
            for (const auto& kv : entries_) {
                out.push_back(kv.second.get());
            }
            return out;
        }

        size_t EntryTable::purge_removed() {
            size_t n = 0;
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (it->second->state()->get_status() == Status::REMOVED) {
                    it = entries_.erase(it);
                    ++n;
                } else {
                    ++it;
                }
            }
            n += graveyard_.size();
            graveyard_.clear();
            if (n > 0) {
                trace() << "purged " << n << " removed entries";
            }
            return n;
        }

    }
}
