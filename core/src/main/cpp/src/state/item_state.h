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
#include "item_status.h"
#include "../persistence/item_id.hpp"
#include "../persistence/node_prop_bundle.h"
#include "../persistence/value.h"

namespace burrow {
    namespace state {

        class HierarchyEntry;

        /**
         * In-memory state of a node or property. Owned by exactly one
         * HierarchyEntry; entry() is a non-owning back pointer that stays
         * valid for the lifetime of the state.
         *
         * The first edit of an EXISTING state asks the entry for a snapshot
         * and moves the state to EXISTING_MODIFIED. Editing a state that is
         * not NEW, EXISTING or EXISTING_MODIFIED throws InvalidItemStateError.
         */
        class ItemState {
        public:
            virtual ~ItemState() = default;

            virtual bool is_node() const = 0;
            virtual persist::ItemId item_id() const = 0;

            Status get_status() const { return status_; }

            // Throws InvalidItemStateError for a transition the status model forbids
            void set_status(Status s);

            // Unchecked; used when coercing after an invariant violation
            void force_status(Status s) { status_ = s; }

            // Modification count of the persisted copy this state is based on
            uint16_t mod_count() const { return mod_count_; }
            void set_mod_count(uint16_t c) { mod_count_ = c; }

            HierarchyEntry* entry() const { return entry_; }

            // EXISTING* becomes EXISTING_REMOVED; a NEW state is discarded
            void mark_removed();

            virtual std::unique_ptr<ItemState> clone() const = 0;

            // Restores attributes (not status or entry) from a state of the same kind
            virtual void copy_from(const ItemState& other) = 0;

        protected:
            explicit ItemState(Status initial) : status_(initial) {}
            ItemState(const ItemState& o) : status_(o.status_), mod_count_(o.mod_count_) {}

            // Called by every mutator before it changes anything
            void modifying();

        private:
            friend class HierarchyEntry;

            Status status_;
            uint16_t mod_count_ = 0;
            HierarchyEntry* entry_ = nullptr;
        };

        class NodeState final : public ItemState {
        public:
            NodeState(const persist::NodeId& id, const persist::NodeId& parent_id,
                      const std::string& node_type, Status initial);

            // Builds an EXISTING state from a persisted bundle
            static std::unique_ptr<NodeState> from_bundle(const persist::NodePropBundle& bundle);

            bool is_node() const override { return true; }
            persist::ItemId item_id() const override { return persist::ItemId(id_); }

            const persist::NodeId& id() const { return id_; }

            const persist::NodeId& parent_id() const { return parent_id_; }
            void set_parent_id(const persist::NodeId& p);

            const std::string& node_type() const { return node_type_; }

            const std::set<std::string>& mixins() const { return mixins_; }
            void set_mixins(const std::set<std::string>& m);

            const std::string& definition_id() const { return definition_id_; }
            void set_definition_id(const std::string& d);

            bool is_referenceable() const { return referenceable_; }
            void set_referenceable(bool r);

            const std::vector<persist::ChildNodeEntry>& child_entries() const { return children_; }
            const persist::ChildNodeEntry* child_entry(const persist::NodeId& id) const;
            const persist::ChildNodeEntry* child_entry(const std::string& name, uint32_t index = 1) const;

            // Appends a child, assigning the next same-name-sibling index
            const persist::ChildNodeEntry& add_child(const std::string& name, const persist::NodeId& id);
            bool remove_child(const persist::NodeId& id);

            const std::set<std::string>& property_names() const { return property_names_; }
            bool has_property(const std::string& name) const { return property_names_.count(name) != 0; }
            void add_property_name(const std::string& name);
            bool remove_property_name(const std::string& name);

            std::unique_ptr<ItemState> clone() const override;
            void copy_from(const ItemState& other) override;

        private:
            NodeState(const NodeState&) = default;

            persist::NodeId id_;
            persist::NodeId parent_id_;
            std::string node_type_;
            std::set<std::string> mixins_;
            std::string definition_id_;
            bool referenceable_ = false;
            std::vector<persist::ChildNodeEntry> children_;
            std::set<std::string> property_names_;
        };

        class PropertyState final : public ItemState {
        public:
            PropertyState(const persist::PropertyId& id, persist::PropertyType type, bool multi_valued,
                          Status initial);

            static std::unique_ptr<PropertyState> from_entry(const persist::PropertyEntry& entry);

            bool is_node() const override { return false; }
            persist::ItemId item_id() const override { return persist::ItemId(id_); }

            const persist::PropertyId& id() const { return id_; }
            const std::string& name() const { return id_.name; }
            const persist::NodeId& parent_id() const { return id_.parent; }

            persist::PropertyType type() const { return type_; }
            bool is_multi_valued() const { return multi_valued_; }

            const std::vector<persist::InternalValue>& values() const { return values_; }

            // Throws std::logic_error unless exactly one value is set
            const persist::InternalValue& value() const;

            /**
             * Replaces all values. Every value must carry the given type and a
             * single-valued property takes exactly one value; violations throw
             * std::invalid_argument.
             */
            void set_values(persist::PropertyType type, const std::vector<persist::InternalValue>& values);

            const std::string& definition_id() const { return definition_id_; }
            void set_definition_id(const std::string& d);

            // Targets of REFERENCE values
            std::vector<persist::NodeId> reference_targets() const;

            persist::PropertyEntry to_entry() const;

            std::unique_ptr<ItemState> clone() const override;
            void copy_from(const ItemState& other) override;

        private:
            PropertyState(const PropertyState&) = default;

            persist::PropertyId id_;
            persist::PropertyType type_;
            bool multi_valued_;
            std::vector<persist::InternalValue> values_;
            std::string definition_id_;
        };

    }
}
