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
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "item_id.hpp"
#include "value.h"

namespace burrow {
    namespace persist {

        struct ChildNodeEntry {
            std::string name;
            NodeId id;
            uint32_t index = 1;     // same-name-sibling index, 1-based

            bool operator==(const ChildNodeEntry& o) const {
                return name == o.name && id == o.id && index == o.index;
            }
        };

        struct PropertyEntry {
            PropertyId id;
            PropertyType type = PropertyType::STRING;
            bool multi_valued = false;
            std::string definition_id;
            uint16_t mod_count = 0;
            std::vector<InternalValue> values;

            // Parallel to values: blob store id of an offloaded value, empty
            // when the value lives inline. Set by the codec on store and load.
            std::vector<std::string> blob_ids;

            bool is_blob(size_t i) const { return i < blob_ids.size() && !blob_ids[i].empty(); }

            // Compares content, not where the values happen to be stored
            bool operator==(const PropertyEntry& o) const {
                return id == o.id && type == o.type && multi_valued == o.multi_valued &&
                       definition_id == o.definition_id && mod_count == o.mod_count &&
                       values == o.values;
            }
            bool operator!=(const PropertyEntry& o) const { return !(*this == o); }
        };

        /**
         * Aggregated persistent state of one node: its own attributes, all of
         * its properties and the list of its child node entries. The unit of
         * atomicity of the bundle store.
         */
        class NodePropBundle {
        public:
            NodePropBundle() = default;
            explicit NodePropBundle(const NodeId& id) : id_(id) {}

            const NodeId& id() const { return id_; }

            const NodeId& parent_id() const { return parent_id_; }
            void set_parent_id(const NodeId& p) { parent_id_ = p; }

            const std::string& node_type() const { return node_type_; }
            void set_node_type(const std::string& t) { node_type_ = t; }

            const std::set<std::string>& mixins() const { return mixins_; }
            void set_mixins(const std::set<std::string>& m) { mixins_ = m; }

            const std::string& definition_id() const { return definition_id_; }
            void set_definition_id(const std::string& d) { definition_id_ = d; }

            bool is_referenceable() const { return referenceable_; }
            void set_referenceable(bool r) { referenceable_ = r; }

            uint16_t mod_count() const { return mod_count_; }
            void set_mod_count(uint16_t c) { mod_count_ = c; }

            const std::vector<ChildNodeEntry>& child_entries() const { return children_; }
            std::vector<ChildNodeEntry>& child_entries() { return children_; }
            void add_child(const std::string& name, const NodeId& id, uint32_t index = 1) {
                children_.push_back(ChildNodeEntry{name, id, index});
            }

            const std::map<std::string, PropertyEntry>& properties() const { return properties_; }
            std::map<std::string, PropertyEntry>& properties() { return properties_; }

            void add_property(const PropertyEntry& p) { properties_[p.id.name] = p; }
            bool has_property(const std::string& name) const { return properties_.count(name) != 0; }
            const PropertyEntry* get_property(const std::string& name) const;
            bool remove_property(const std::string& name) { return properties_.erase(name) != 0; }

            // Blob ids of all offloaded values of this bundle
            std::vector<std::string> blob_ids() const;

            // On-disk size, stamped by the persistence manager after load/store
            size_t size() const { return size_; }
            void set_size(size_t s) { size_ = s; }

            bool operator==(const NodePropBundle& o) const;
            bool operator!=(const NodePropBundle& o) const { return !(*this == o); }

        private:
            NodeId id_;
            NodeId parent_id_;
            std::string node_type_;
            std::set<std::string> mixins_;
            std::string definition_id_;
            bool referenceable_ = false;
            uint16_t mod_count_ = 0;
            std::vector<ChildNodeEntry> children_;
            std::map<std::string, PropertyEntry> properties_;
            size_t size_ = 0;
        };

        /**
         * Reverse references to one target node: the REFERENCE properties
         * currently pointing at it.
         */
        class NodeReferences {
        public:
            NodeReferences() = default;
            explicit NodeReferences(const NodeId& target) : target_(target) {}

            const NodeId& target_id() const { return target_; }

            const std::vector<PropertyId>& references() const { return refs_; }

            void add_reference(const PropertyId& p) { refs_.push_back(p); }

            // Removes one occurrence; false when p was not listed
            bool remove_reference(const PropertyId& p);

            bool has_references() const { return !refs_.empty(); }

            void clear() { refs_.clear(); }

            bool operator==(const NodeReferences& o) const {
                return target_ == o.target_ && refs_ == o.refs_;
            }

        private:
            NodeId target_;
            std::vector<PropertyId> refs_;
        };

    }
}
