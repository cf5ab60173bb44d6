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

#include "operation.h"
#include "../errors.h"
#include "../util/log.h"
#include <algorithm>

namespace burrow {
    namespace state {

        using persist::InternalValue;
        using persist::NodeId;
        using persist::PropertyId;
        using persist::PropertyType;

        void Operation::add_affected(ItemState* s) {
            if (std::find(affected_.begin(), affected_.end(), s) == affected_.end()) {
                affected_.push_back(s);
            }
        }

        void Operation::undo() {
            for (auto it = affected_.rbegin(); it != affected_.rend(); ++it) {
                if (HierarchyEntry* e = (*it)->entry()) {
                    e->revert();
                }
            }
        }

        // AddNode

        AddNode::AddNode(NodeState& parent, NodeState* child) : parent_(parent), child_(child) {
            add_affected(&parent);
            add_affected(child);
        }

        std::unique_ptr<AddNode> AddNode::create(EntryTable& table, NodeState& parent, const std::string& name,
                                                 const NodeId& id, const std::string& node_type) {
            if (table.get(persist::ItemId(id)) && table.get(persist::ItemId(id))->state()->get_status() != Status::REMOVED) {
                throw InvalidItemStateError("node " + id.to_string() + " already exists");
            }
            parent.add_child(name, id);

            auto child = std::make_unique<NodeState>(id, parent.id(), node_type, Status::NEW);
            NodeState* raw = child.get();
            table.add(std::move(child));
            return std::unique_ptr<AddNode>(new AddNode(parent, raw));
        }

        void AddNode::persisted() {
            if (child_->get_status() == Status::NEW) {
                child_->set_status(Status::EXISTING);
                child_->entry()->commit();
            }
        }

        // AddProperty

        AddProperty::AddProperty(NodeState& parent, PropertyState* property)
            : parent_(parent), property_(property) {
            add_affected(&parent);
            add_affected(property);
        }

        std::unique_ptr<AddProperty> AddProperty::create(EntryTable& table, NodeState& parent, const std::string& name,
                                                         PropertyType type, const std::vector<InternalValue>& values,
                                                         bool multi_valued) {
            if (parent.has_property(name)) {
                throw InvalidItemStateError("property " + name + " already exists on " + parent.id().to_string());
            }

            auto prop = std::make_unique<PropertyState>(PropertyId(parent.id(), name), type,
                                                        multi_valued, Status::NEW);
            prop->set_values(type, values);
            parent.add_property_name(name);

            PropertyState* raw = prop.get();
            table.add(std::move(prop));
            return std::unique_ptr<AddProperty>(new AddProperty(parent, raw));
        }

        void AddProperty::persisted() {
            if (property_->get_status() == Status::NEW) {
                property_->set_status(Status::EXISTING);
                property_->entry()->commit();
            }
        }

        // SetPropertyValue

        SetPropertyValue::SetPropertyValue(PropertyState& property) {
            add_affected(&property);
        }

        std::unique_ptr<SetPropertyValue> SetPropertyValue::create(PropertyState& property, PropertyType type,
                                                                   const std::vector<InternalValue>& values) {
            property.set_values(type, values);
            return std::unique_ptr<SetPropertyValue>(new SetPropertyValue(property));
        }

        // SetMixin

        SetMixin::SetMixin(NodeState& node) : node_(node) {
            add_affected(&node);
        }

        std::unique_ptr<SetMixin> SetMixin::create(NodeState& node, const std::set<std::string>& mixins) {
            node.set_mixins(mixins);
            return std::unique_ptr<SetMixin>(new SetMixin(node));
        }

        void SetMixin::persisted() {
            if (HierarchyEntry* e = node_.entry()) {
                e->set_needs_reload(true);
            }
        }

        // Remove

        Remove::Remove(ItemState& target, NodeState& parent) : target_(target) {
            add_affected(&parent);
            add_affected(&target);
        }

        std::unique_ptr<Remove> Remove::create(ItemState& target, NodeState& parent,
                                               const std::vector<ItemState*>& descendants) {
            if (!is_editable(target.get_status())) {
                throw InvalidItemStateError("cannot remove " + target.item_id().to_string() + " in status " +
                                            status_name(target.get_status()));
            }

            if (target.is_node()) {
                const NodeState& node = static_cast<const NodeState&>(target);
                if (!parent.remove_child(node.id())) {
                    throw InvalidItemStateError(node.id().to_string() + " is not a child of " +
                                                parent.id().to_string());
                }
            } else {
                const PropertyState& prop = static_cast<const PropertyState&>(target);
                if (!parent.remove_property_name(prop.name())) {
                    throw InvalidItemStateError(prop.id().to_string() + " is not a property of " +
                                                parent.id().to_string());
                }
            }

            std::unique_ptr<Remove> op(new Remove(target, parent));
            for (ItemState* d : descendants) {
                d->mark_removed();
                op->add_affected(d);
            }
            target.mark_removed();
            return op;
        }

        // Move

        Move::Move(NodeState& node, NodeState& src_parent, NodeState& dest_parent) {
            add_affected(&src_parent);
            add_affected(&dest_parent);
            add_affected(&node);
        }

        std::unique_ptr<Move> Move::create(NodeState& node, NodeState& src_parent, NodeState& dest_parent,
                                           const std::string& dest_name) {
            if (!src_parent.child_entry(node.id())) {
                throw InvalidItemStateError(node.id().to_string() + " is not a child of " +
                                            src_parent.id().to_string());
            }
            if (!is_editable(node.get_status()) || !is_editable(dest_parent.get_status())) {
                throw InvalidItemStateError("cannot move " + node.id().to_string() + ", reload first");
            }

            src_parent.remove_child(node.id());
            dest_parent.add_child(dest_name, node.id());
            node.set_parent_id(dest_parent.id());

            trace() << "moved " << node.id().to_string() << " to " << dest_parent.id().to_string()
                    << "/" << dest_name;
            return std::unique_ptr<Move>(new Move(node, src_parent, dest_parent));
        }

    }
}
