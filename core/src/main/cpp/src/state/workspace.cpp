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

#include "workspace.h"
#include "../errors.h"
#include "../util/log.h"
#include <algorithm>
#include <boost/thread/lock_guard.hpp>

namespace burrow {
    namespace state {

        using persist::ChangeSet;
        using persist::InternalValue;
        using persist::ItemId;
        using persist::NodeId;
        using persist::NodePropBundle;
        using persist::NodeReferences;
        using persist::PropertyEntry;
        using persist::PropertyId;
        using persist::PropertyType;

        typedef boost::lock_guard<boost::recursive_mutex> Guard;

        namespace {
            bool is_reloadable(Status s) {
                return s == Status::EXISTING || s == Status::INVALIDATED;
            }

            bool is_pending(Status s) {
                return s == Status::NEW || s == Status::EXISTING_MODIFIED || s == Status::EXISTING_REMOVED;
            }
        }

        Workspace::Workspace(persist::PersistenceManager& pm, const StateConfig& config)
            : pm_(pm), config_(config) {}

        HierarchyEntry* Workspace::live_entry(const ItemId& id) const {
            HierarchyEntry* e = table_.get(id);
            return e && e->state()->get_status() != Status::REMOVED ? e : nullptr;
        }

        NodeState& Workspace::ensure_root(const NodeId& root_id, const std::string& node_type) {
            Guard g(mutex_);
            if (!live_entry(ItemId(root_id)) && !pm_.exists(root_id)) {
                NodePropBundle root(root_id);
                root.set_node_type(node_type);
                pm_.store(root);
                info() << "created root node " << root_id.to_string();
            }
            return get_node(root_id);
        }

        // Loading

        NodeState& Workspace::load_node(const NodeId& id) {
            std::unique_ptr<NodePropBundle> bundle = pm_.load(id);
            if (!bundle) {
                throw NoSuchItemStateError("node " + id.to_string() + " not found");
            }

            HierarchyEntry& entry = table_.add(NodeState::from_bundle(*bundle));
            for (const auto& kv : bundle->properties()) {
                HierarchyEntry* pe = live_entry(ItemId(kv.second.id));
                if (!pe) {
                    table_.add(PropertyState::from_entry(kv.second));
                } else if (is_reloadable(pe->state()->get_status())) {
                    pe->reload(*PropertyState::from_entry(kv.second));
                }
            }
            return *entry.node_state();
        }

        void Workspace::reload_node(HierarchyEntry& entry) {
            const NodeId id = entry.id().node;
            std::unique_ptr<NodePropBundle> bundle = pm_.load(id);
            if (!bundle) {
                entry.remove();
                for (HierarchyEntry* pe : table_.property_entries(id)) {
                    if (is_reloadable(pe->state()->get_status())) pe->remove();
                }
                throw NoSuchItemStateError("node " + id.to_string() + " no longer exists");
            }

            entry.reload(*NodeState::from_bundle(*bundle));
            for (const auto& kv : bundle->properties()) {
                HierarchyEntry* pe = live_entry(ItemId(kv.second.id));
                if (!pe) {
                    table_.add(PropertyState::from_entry(kv.second));
                } else if (is_reloadable(pe->state()->get_status())) {
                    pe->reload(*PropertyState::from_entry(kv.second));
                }
            }
            for (HierarchyEntry* pe : table_.property_entries(id)) {
                if (!bundle->has_property(pe->id().property) && is_reloadable(pe->state()->get_status())) {
                    pe->remove();
                }
            }
            trace() << "reloaded " << id.to_string();
        }

        NodeState& Workspace::get_node(const NodeId& id) {
            Guard g(mutex_);
            HierarchyEntry* e = live_entry(ItemId(id));
            if (!e) {
                return load_node(id);
            }
            const Status s = e->state()->get_status();
            if (s == Status::INVALIDATED || (s == Status::EXISTING && e->needs_reload())) {
                reload_node(*e);
            }
            return *e->node_state();
        }

        bool Workspace::has_node(const NodeId& id) {
            try {
                get_node(id);
                return true;
            } catch (const NoSuchItemStateError&) {
                return false;
            }
        }

        PropertyState& Workspace::get_property(const PropertyId& id) {
            Guard g(mutex_);
            NodeState& node = get_node(id.parent);
            if (!node.has_property(id.name)) {
                throw NoSuchItemStateError("property " + id.to_string() + " not found");
            }

            HierarchyEntry* e = live_entry(ItemId(id));
            const bool stale_entry = e && (e->state()->get_status() == Status::INVALIDATED ||
                                           (e->state()->get_status() == Status::EXISTING && e->needs_reload()));
            if (e && !stale_entry) {
                return *e->property_state();
            }

            std::unique_ptr<NodePropBundle> bundle = pm_.load(id.parent);
            const PropertyEntry* pe = bundle ? bundle->get_property(id.name) : nullptr;
            if (!pe) {
                if (e) e->remove();
                throw NoSuchItemStateError("property " + id.to_string() + " no longer exists");
            }
            if (e) {
                e->reload(*PropertyState::from_entry(*pe));
                return *e->property_state();
            }
            return *table_.add(PropertyState::from_entry(*pe)).property_state();
        }

        // Edits

        NodeState& Workspace::add_node(ChangeLog& log, const NodeId& parent, const std::string& name,
                                       const std::string& node_type, const NodeId& id) {
            Guard g(mutex_);
            NodeState& parent_state = get_node(parent);
            if (pm_.exists(id)) {
                throw InvalidItemStateError("node " + id.to_string() + " already exists");
            }
            std::unique_ptr<AddNode> op = AddNode::create(table_, parent_state, name, id, node_type);
            NodeState& child = op->child();
            log.add(std::move(op));
            return child;
        }

        PropertyState& Workspace::add_property(ChangeLog& log, const NodeId& parent, const std::string& name,
                                               PropertyType type, const std::vector<InternalValue>& values,
                                               bool multi_valued) {
            Guard g(mutex_);
            NodeState& parent_state = get_node(parent);
            std::unique_ptr<AddProperty> op = AddProperty::create(table_, parent_state, name, type, values,
                                                                  multi_valued);
            PropertyState& prop = op->property();
            log.add(std::move(op));
            return prop;
        }

        void Workspace::set_value(ChangeLog& log, const PropertyId& id, PropertyType type,
                                  const std::vector<InternalValue>& values) {
            Guard g(mutex_);
            PropertyState& prop = get_property(id);
            log.add(SetPropertyValue::create(prop, type, values));
        }

        void Workspace::set_mixins(ChangeLog& log, const NodeId& id, const std::set<std::string>& mixins) {
            Guard g(mutex_);
            NodeState& node = get_node(id);
            log.add(SetMixin::create(node, mixins));
        }

        void Workspace::collect_subtree(NodeState& node, std::vector<ItemState*>& out) {
            for (const std::string& name : node.property_names()) {
                out.push_back(&get_property(PropertyId(node.id(), name)));
            }
            const std::vector<persist::ChildNodeEntry> children = node.child_entries();
            for (const auto& c : children) {
                NodeState& child = get_node(c.id);
                collect_subtree(child, out);
                out.push_back(&child);
            }
        }

        void Workspace::remove(ChangeLog& log, const ItemId& id) {
            Guard g(mutex_);
            if (!id.is_node()) {
                PropertyState& prop = get_property(id.property_id());
                NodeState& parent = get_node(prop.parent_id());
                log.add(Remove::create(prop, parent, std::vector<ItemState*>()));
                return;
            }

            NodeState& node = get_node(id.node);
            if (node.parent_id().is_nil()) {
                throw InvalidItemStateError("cannot remove root node " + id.to_string());
            }
            NodeState& parent = get_node(node.parent_id());
            std::vector<ItemState*> descendants;
            collect_subtree(node, descendants);
            log.add(Remove::create(node, parent, descendants));
        }

        void Workspace::move(ChangeLog& log, const NodeId& id, const NodeId& dest_parent,
                             const std::string& dest_name) {
            Guard g(mutex_);
            NodeState& node = get_node(id);
            if (node.parent_id().is_nil()) {
                throw InvalidItemStateError("cannot move root node " + id.to_string());
            }
            NodeState& src = get_node(node.parent_id());
            NodeState& dest = get_node(dest_parent);

            // dest must not lie inside the moved subtree
            for (NodeId cur = dest.id(); !cur.is_nil(); cur = get_node(cur).parent_id()) {
                if (cur == id) {
                    throw InvalidItemStateError("cannot move " + id.to_string() + " below itself");
                }
            }
            log.add(Move::create(node, src, dest, dest_name));
        }

        // Save

        Workspace::SaveScope Workspace::collect_scope(const ChangeLog& log) {
            SaveScope scope;
            for (ItemState* s : log.affected_states()) {
                const Status st = s->get_status();
                if (is_stale(st)) {
                    scope.stale = true;
                }
                if (s->is_node()) {
                    const NodeId& id = static_cast<NodeState*>(s)->id();
                    if (st == Status::EXISTING_REMOVED || st == Status::STALE_DESTROYED) {
                        scope.deleted.insert(id);
                    } else if (is_pending(st) || st == Status::STALE_MODIFIED) {
                        scope.modified.insert(id);
                    }
                } else if (is_pending(st) || is_stale(st)) {
                    scope.modified.insert(static_cast<PropertyState*>(s)->parent_id());
                }
            }
            for (const NodeId& id : scope.deleted) {
                scope.modified.erase(id);
            }
            return scope;
        }

        void Workspace::check_stale(SaveScope& scope) {
            std::vector<NodeId> ids(scope.modified.begin(), scope.modified.end());
            ids.insert(ids.end(), scope.deleted.begin(), scope.deleted.end());

            for (const NodeId& id : ids) {
                HierarchyEntry* e = live_entry(ItemId(id));
                if (!e) {
                    throw InvalidItemStateError("changed node " + id.to_string() + " is not loaded");
                }
                NodeState* node = e->node_state();
                if (node->get_status() == Status::NEW) {
                    continue;
                }

                std::unique_ptr<NodePropBundle> current = pm_.load(id);
                if (!current) {
                    debug() << id.to_string() << " was destroyed externally";
                    mark_node_external(id, true);
                    scope.stale = true;
                } else if (current->mod_count() != node->mod_count()) {
                    debug() << id.to_string() << " was modified externally (mod count "
                            << current->mod_count() << ", expected " << node->mod_count() << ")";
                    mark_node_external(id, false);
                    scope.stale = true;
                }
                scope.persisted[id] = std::move(current);
            }

            if (scope.stale) {
                throw StaleItemStateError("items were modified externally, reload and retry");
            }
        }

        NodePropBundle Workspace::to_bundle(const NodeState& node, const NodePropBundle* old) {
            NodePropBundle b(node.id());
            b.set_parent_id(node.parent_id());
            b.set_node_type(node.node_type());
            b.set_mixins(node.mixins());
            b.set_definition_id(node.definition_id());
            b.set_referenceable(node.is_referenceable());
            b.set_mod_count(node.get_status() == Status::NEW ? 0 : static_cast<uint16_t>(node.mod_count() + 1));
            for (const auto& c : node.child_entries()) {
                b.add_child(c.name, c.id, c.index);
            }

            for (const std::string& name : node.property_names()) {
                HierarchyEntry* pe = live_entry(ItemId(PropertyId(node.id(), name)));
                if (pe) {
                    const PropertyState& prop = *pe->property_state();
                    PropertyEntry entry = prop.to_entry();
                    if (prop.get_status() == Status::NEW) {
                        entry.mod_count = 0;
                    } else if (prop.get_status() == Status::EXISTING_MODIFIED) {
                        entry.mod_count = static_cast<uint16_t>(prop.mod_count() + 1);
                    }
                    b.add_property(entry);
                } else if (old && old->has_property(name)) {
                    b.add_property(*old->get_property(name));
                } else {
                    error() << "property " << name << " of " << node.id().to_string() << " has no state";
                    throw ItemStateError("missing state for property " + name + " of " + node.id().to_string());
                }
            }
            return b;
        }

        void Workspace::collect_reference_changes(const ChangeLog& log, ChangeSet& changes) {
            // per target: referring property ids added and removed by this save
            std::map<NodeId, std::pair<std::vector<PropertyId>, std::vector<PropertyId>>> delta;

            for (ItemState* s : log.affected_states()) {
                if (s->is_node()) continue;
                const PropertyState& prop = *static_cast<PropertyState*>(s);
                const Status st = prop.get_status();
                if (!is_pending(st)) continue;

                std::vector<NodeId> before;
                if (st != Status::NEW) {
                    const ItemState* snap = prop.entry() ? prop.entry()->snapshot_state() : nullptr;
                    before = snap ? static_cast<const PropertyState*>(snap)->reference_targets()
                                  : prop.reference_targets();
                }
                std::vector<NodeId> after;
                if (st != Status::EXISTING_REMOVED) {
                    after = prop.reference_targets();
                }

                for (const NodeId& t : before) {
                    auto it = std::find(after.begin(), after.end(), t);
                    if (it != after.end()) {
                        after.erase(it);
                    } else {
                        delta[t].second.push_back(prop.id());
                    }
                }
                for (const NodeId& t : after) {
                    delta[t].first.push_back(prop.id());
                }
            }

            for (const auto& kv : delta) {
                const NodeId& target = kv.first;
                const bool existed = pm_.exists_references(target);
                NodeReferences refs = existed ? pm_.load_references(target) : NodeReferences(target);
                for (const PropertyId& p : kv.second.second) {
                    if (!refs.remove_reference(p)) {
                        warning() << "reference from " << p.to_string() << " to " << target.to_string()
                                  << " was not recorded";
                    }
                }
                for (const PropertyId& p : kv.second.first) {
                    refs.add_reference(p);
                }
                if (refs.has_references()) {
                    changes.modified_refs.push_back(refs);
                } else if (existed) {
                    changes.deleted_refs.push_back(target);
                }
            }
        }

        void Workspace::build_change_set(const ChangeLog& log, SaveScope& scope, ChangeSet& changes) {
            for (const NodeId& id : scope.modified) {
                auto it = scope.persisted.find(id);
                const NodePropBundle* old = it == scope.persisted.end() ? nullptr : it->second.get();
                changes.modified.push_back(to_bundle(*live_entry(ItemId(id))->node_state(), old));
            }
            for (const NodeId& id : scope.deleted) {
                changes.deleted.push_back(id);
            }
            collect_reference_changes(log, changes);
        }

        Workspace::ModCounts Workspace::mod_counts_of(const ChangeSet& changes) {
            ModCounts counts;
            for (const NodePropBundle& b : changes.modified) {
                counts.emplace_back(ItemId(b.id()), b.mod_count());
                for (const auto& kv : b.properties()) {
                    counts.emplace_back(ItemId(kv.second.id), kv.second.mod_count);
                }
            }
            return counts;
        }

        void Workspace::apply_mod_counts(const ModCounts& counts) {
            for (const auto& c : counts) {
                if (HierarchyEntry* e = live_entry(c.first)) {
                    e->state()->set_mod_count(c.second);
                }
            }
        }

        void Workspace::save(ChangeLog& log) {
            Guard g(mutex_);
            if (log.is_empty()) {
                trace() << "nothing to save";
                return;
            }

            ModCounts counts;
            size_t bundles = 0;
            auto prepare = [&](ChangeSet& changes) {
                SaveScope scope = collect_scope(log);
                check_stale(scope);
                build_change_set(log, scope, changes);
                counts = mod_counts_of(changes);
                bundles = changes.modified.size() + changes.deleted.size();
            };

            try {
                if (committer_) {
                    committer_->commit(prepare);
                } else {
                    ChangeSet changes;
                    prepare(changes);
                    pm_.store(changes);
                }
            } catch (const std::exception& e) {
                debug() << "save of " << log.target().to_string() << " failed, undoing: " << e.what();
                try {
                    log.undo();
                } catch (const std::exception& ue) {
                    warning() << "undo after failed save: " << ue.what();
                }
                throw;
            }

            apply_mod_counts(counts);
            log.persisted();
            table_.purge_removed();
            debug() << "saved " << bundles << " bundles for " << log.target().to_string();
        }

        // External changes

        void Workspace::refresh() {
            Guard g(mutex_);
            for (HierarchyEntry* e : table_.all()) {
                if (e->state()->get_status() == Status::EXISTING) {
                    e->invalidate(false);
                }
            }
        }

        void Workspace::mark_external(HierarchyEntry& entry, bool destroyed) {
            switch (entry.state()->get_status()) {
                case Status::EXISTING:
                case Status::INVALIDATED:
                    if (destroyed) {
                        entry.remove();
                    } else {
                        entry.invalidate(false);
                    }
                    break;
                case Status::EXISTING_MODIFIED:
                case Status::EXISTING_REMOVED:
                    entry.state()->set_status(destroyed ? Status::STALE_DESTROYED : Status::STALE_MODIFIED);
                    break;
                default:
                    break;
            }
        }

        void Workspace::mark_node_external(const NodeId& id, bool destroyed) {
            if (HierarchyEntry* e = live_entry(ItemId(id))) {
                mark_external(*e, destroyed);
            }
            for (HierarchyEntry* pe : table_.property_entries(id)) {
                mark_external(*pe, destroyed);
            }
        }

        void Workspace::external_update(const ChangeSet& changes) {
            Guard g(mutex_);
            for (const NodePropBundle& b : changes.modified) {
                mark_node_external(b.id(), false);
            }
            for (const NodeId& id : changes.deleted) {
                mark_node_external(id, true);
            }
            debug() << "external update: " << changes.modified.size() << " modified, "
                    << changes.deleted.size() << " deleted";
        }

    }
}
