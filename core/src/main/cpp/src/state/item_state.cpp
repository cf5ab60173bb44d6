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

#include "item_state.h"
#include "hierarchy_entry.h"
#include "../errors.h"
#include <algorithm>

namespace burrow {
    namespace state {

        using persist::ChildNodeEntry;
        using persist::InternalValue;
        using persist::NodeId;
        using persist::PropertyType;

        void ItemState::set_status(Status s) {
            if (!is_valid_transition(status_, s)) {
                throw InvalidItemStateError(std::string("illegal status transition ") + status_name(status_) +
                                            " -> " + status_name(s) + " for " + item_id().to_string());
            }
            status_ = s;
        }

        void ItemState::modifying() {
            if (!is_editable(status_)) {
                throw InvalidItemStateError("cannot modify " + item_id().to_string() + " in status " +
                                            status_name(status_) + ", reload first");
            }
            if (status_ == Status::EXISTING) {
                if (entry_) {
                    entry_->snapshot();
                }
                status_ = Status::EXISTING_MODIFIED;
            }
        }

        void ItemState::mark_removed() {
            if (status_ == Status::NEW) {
                if (entry_) {
                    entry_->remove();
                } else {
                    status_ = Status::REMOVED;
                }
                return;
            }
            modifying();
            set_status(Status::EXISTING_REMOVED);
        }

        // NodeState

        NodeState::NodeState(const NodeId& id, const NodeId& parent_id, const std::string& node_type,
                             Status initial)
            : ItemState(initial), id_(id), parent_id_(parent_id), node_type_(node_type) {}

        std::unique_ptr<NodeState> NodeState::from_bundle(const persist::NodePropBundle& bundle) {
            auto s = std::make_unique<NodeState>(bundle.id(), bundle.parent_id(),
                                                 bundle.node_type(), Status::EXISTING);
            s->mixins_ = bundle.mixins();
            s->definition_id_ = bundle.definition_id();
            s->referenceable_ = bundle.is_referenceable();
            s->children_ = bundle.child_entries();
            for (const auto& kv : bundle.properties()) {
                s->property_names_.insert(kv.first);
            }
            s->set_mod_count(bundle.mod_count());
            return s;
        }

        void NodeState::set_parent_id(const NodeId& p) {
            modifying();
            parent_id_ = p;
        }

        void NodeState::set_mixins(const std::set<std::string>& m) {
            modifying();
            mixins_ = m;
        }

        void NodeState::set_definition_id(const std::string& d) {
            modifying();
            definition_id_ = d;
        }

        void NodeState::set_referenceable(bool r) {
            modifying();
            referenceable_ = r;
        }

        const ChildNodeEntry* NodeState::child_entry(const NodeId& id) const {
            for (const auto& c : children_) {
                if (c.id == id) return &c;
            }
            return nullptr;
        }

        const ChildNodeEntry* NodeState::child_entry(const std::string& name, uint32_t index) const {
            for (const auto& c : children_) {
                if (c.name == name && c.index == index) return &c;
            }
            return nullptr;
        }

        const ChildNodeEntry& NodeState::add_child(const std::string& name, const NodeId& id) {
            modifying();
            uint32_t index = 1;
            for (const auto& c : children_) {
                if (c.name == name) index = std::max(index, c.index + 1);
            }
            children_.push_back(ChildNodeEntry{name, id, index});
            return children_.back();
        }

        bool NodeState::remove_child(const NodeId& id) {
            auto it = std::find_if(children_.begin(), children_.end(),
                                   [&](const ChildNodeEntry& c) { return c.id == id; });
            if (it == children_.end()) {
                return false;
            }
            modifying();
            const std::string name = it->name;
            const uint32_t index = it->index;
            children_.erase(it);
            // later siblings of the same name move up
            for (auto& c : children_) {
                if (c.name == name && c.index > index) --c.index;
            }
            return true;
        }

        void NodeState::add_property_name(const std::string& name) {
            modifying();
            property_names_.insert(name);
        }

        bool NodeState::remove_property_name(const std::string& name) {
            if (!property_names_.count(name)) {
                return false;
            }
            modifying();
            property_names_.erase(name);
            return true;
        }

        std::unique_ptr<ItemState> NodeState::clone() const {
            return std::unique_ptr<ItemState>(new NodeState(*this));
        }

        void NodeState::copy_from(const ItemState& other) {
            const NodeState& o = dynamic_cast<const NodeState&>(other);
            parent_id_ = o.parent_id_;
            node_type_ = o.node_type_;
            mixins_ = o.mixins_;
            definition_id_ = o.definition_id_;
            referenceable_ = o.referenceable_;
            children_ = o.children_;
            property_names_ = o.property_names_;
            set_mod_count(o.mod_count());
        }

        // PropertyState

        PropertyState::PropertyState(const persist::PropertyId& id, PropertyType type, bool multi_valued,
                                     Status initial)
            : ItemState(initial), id_(id), type_(type), multi_valued_(multi_valued) {}

        std::unique_ptr<PropertyState> PropertyState::from_entry(const persist::PropertyEntry& entry) {
            auto s = std::make_unique<PropertyState>(entry.id, entry.type, entry.multi_valued,
                                                     Status::EXISTING);
            s->values_ = entry.values;
            s->definition_id_ = entry.definition_id;
            s->set_mod_count(entry.mod_count);
            return s;
        }

        const InternalValue& PropertyState::value() const {
            if (values_.size() != 1) {
                throw std::logic_error("property " + id_.to_string() + " has " +
                                       std::to_string(values_.size()) + " values");
            }
            return values_.front();
        }

        void PropertyState::set_values(PropertyType type, const std::vector<InternalValue>& values) {
            if (!multi_valued_ && values.size() != 1) {
                throw std::invalid_argument("single-valued property " + id_.to_string() + " needs one value");
            }
            for (const auto& v : values) {
                if (v.type() != type) {
                    throw std::invalid_argument(std::string("value of type ") + persist::property_type_name(v.type()) +
                                                " for property " + id_.to_string() + " of type " +
                                                persist::property_type_name(type));
                }
            }
            modifying();
            type_ = type;
            values_ = values;
        }

        void PropertyState::set_definition_id(const std::string& d) {
            modifying();
            definition_id_ = d;
        }

        std::vector<NodeId> PropertyState::reference_targets() const {
            std::vector<NodeId> targets;
            if (type_ == PropertyType::REFERENCE) {
                for (const auto& v : values_) {
                    targets.push_back(v.get_reference());
                }
            }
            return targets;
        }

        persist::PropertyEntry PropertyState::to_entry() const {
            persist::PropertyEntry e;
            e.id = id_;
            e.type = type_;
            e.multi_valued = multi_valued_;
            e.definition_id = definition_id_;
            e.mod_count = mod_count();
            e.values = values_;
            return e;
        }

        std::unique_ptr<ItemState> PropertyState::clone() const {
            return std::unique_ptr<ItemState>(new PropertyState(*this));
        }

        void PropertyState::copy_from(const ItemState& other) {
            const PropertyState& o = dynamic_cast<const PropertyState&>(other);
            type_ = o.type_;
            multi_valued_ = o.multi_valued_;
            values_ = o.values_;
            definition_id_ = o.definition_id_;
            set_mod_count(o.mod_count());
        }

    }
}
