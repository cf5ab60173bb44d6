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
#include <cstring>
#include <functional>
#include <string>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/functional/hash.hpp>

namespace burrow {
    namespace persist {

        /**
         * NodeId is the stable 128-bit identity of a node. It never changes
         * across moves and is the key of the node's bundle on disk.
         */
        class NodeId {
        public:
            static constexpr size_t kSize = 16;

            NodeId() : uuid_(boost::uuids::nil_uuid()) {}
            explicit NodeId(const boost::uuids::uuid& u) : uuid_(u) {}

            static NodeId random() {
                static thread_local boost::uuids::random_generator gen;
                return NodeId(gen());
            }

            static NodeId nil() { return NodeId(); }

            // Throws std::runtime_error on malformed input
            static NodeId from_string(const std::string& s) {
                boost::uuids::string_generator gen;
                return NodeId(gen(s));
            }

            static NodeId from_bytes(const uint8_t* b) {
                boost::uuids::uuid u;
                std::memcpy(u.data, b, kSize);
                return NodeId(u);
            }

            void to_bytes(uint8_t* out) const { std::memcpy(out, uuid_.data, kSize); }

            std::string to_string() const { return boost::uuids::to_string(uuid_); }

            bool is_nil() const { return uuid_.is_nil(); }

            const boost::uuids::uuid& uuid() const { return uuid_; }

            bool operator==(const NodeId& o) const { return uuid_ == o.uuid_; }
            bool operator!=(const NodeId& o) const { return uuid_ != o.uuid_; }
            bool operator<(const NodeId& o) const { return uuid_ < o.uuid_; }

        private:
            boost::uuids::uuid uuid_;
        };

        /**
         * A property is identified by its owning node and its name.
         */
        struct PropertyId {
            NodeId parent;
            std::string name;

            PropertyId() = default;
            PropertyId(const NodeId& p, const std::string& n) : parent(p), name(n) {}

            std::string to_string() const { return parent.to_string() + "/" + name; }

            bool operator==(const PropertyId& o) const { return parent == o.parent && name == o.name; }
            bool operator!=(const PropertyId& o) const { return !(*this == o); }
            bool operator<(const PropertyId& o) const {
                return parent == o.parent ? name < o.name : parent < o.parent;
            }
        };

        /**
         * Item identity used by hierarchy entries: a node when property is
         * empty, otherwise the named property of node.
         */
        struct ItemId {
            NodeId node;
            std::string property;

            ItemId() = default;
            ItemId(const NodeId& n) : node(n) {}
            ItemId(const PropertyId& p) : node(p.parent), property(p.name) {}

            bool is_node() const { return property.empty(); }
            PropertyId property_id() const { return PropertyId(node, property); }

            std::string to_string() const {
                return is_node() ? node.to_string() : node.to_string() + "/" + property;
            }

            bool operator==(const ItemId& o) const { return node == o.node && property == o.property; }
            bool operator!=(const ItemId& o) const { return !(*this == o); }
            bool operator<(const ItemId& o) const {
                return node == o.node ? property < o.property : node < o.node;
            }
        };

    }
}

namespace std {
    template<> struct hash<burrow::persist::NodeId> {
        size_t operator()(const burrow::persist::NodeId& id) const noexcept {
            return boost::hash<boost::uuids::uuid>()(id.uuid());
        }
    };

    template<> struct hash<burrow::persist::PropertyId> {
        size_t operator()(const burrow::persist::PropertyId& id) const noexcept {
            size_t seed = hash<burrow::persist::NodeId>()(id.parent);
            boost::hash_combine(seed, id.name);
            return seed;
        }
    };

    template<> struct hash<burrow::persist::ItemId> {
        size_t operator()(const burrow::persist::ItemId& id) const noexcept {
            size_t seed = hash<burrow::persist::NodeId>()(id.node);
            boost::hash_combine(seed, id.property);
            return seed;
        }
    };
}
