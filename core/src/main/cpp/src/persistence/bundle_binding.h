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
#include <string>
#include <vector>
#include "blob_store.h"
#include "name_index.h"
#include "node_prop_bundle.h"

namespace burrow {
    namespace persist {

        /**
         * Bundle codec. Wire layout of a bundle record (little-endian):
         *
         *   magic(4) version(1) id(16) parent(16) type(name) mixin_count(4) {name}*
         *   definition(str) prop_count(4) {
         *       name(4) type(1) flags(1) definition(str) mod_count(2)
         *       value_count(4) { kind(1) inline: bytes | blob: str }
         *   }*
         *   child_count(4) { name(4) id(16) index(4) }*
         *   referenceable(1) mod_count(2) crc32c(4)
         *
         * Names are stored as name index entries. Values whose serialized size
         * reaches min_blob_size are written to the blob store and referenced by
         * id; everything else is inlined.
         *
         * A blob written for a new bundle never reuses an id the stored bundle
         * still points at, so the stored bundle stays readable until the new
         * record replaces it. A value whose stored blob already holds the same
         * bytes keeps that blob and is not written again.
         */
        class BundleBinding {
        public:
            enum ValueKind : uint8_t { kInline = 0, kBlob = 1 };
            enum PropertyFlags : uint8_t { kMultiValued = 0x01 };

            BundleBinding(NameIndex& names, BlobStore& blobs, uint32_t min_blob_size)
                : names_(names), blobs_(blobs), min_blob_size_(min_blob_size) {}

            uint32_t min_blob_size() const { return min_blob_size_; }
            void set_min_blob_size(uint32_t s) { min_blob_size_ = s; }

            /**
             * Offloads large values to the blob store and records their ids in
             * bundle. stored is the record currently on disk for the same node,
             * read without blobs, or nullptr. Ids of the blobs put are appended
             * to written as they are stored, also when encoding fails later.
             */
            std::vector<uint8_t> write_bundle(NodePropBundle& bundle, const NodePropBundle* stored = nullptr,
                                              std::vector<std::string>* written = nullptr);

            /**
             * Decodes a bundle record. With load_blobs false the offloaded
             * values are left empty and only their blob ids are filled in.
             * Throws ItemStateError on a malformed or corrupt record.
             */
            NodePropBundle read_bundle(const std::vector<uint8_t>& data, bool load_blobs = true) const;

            std::vector<uint8_t> write_references(const NodeReferences& refs);
            NodeReferences read_references(const std::vector<uint8_t>& data) const;

            // "<node base>.<name>.<index>.<generation>.b"
            std::string blob_id(const PropertyId& id, size_t index, uint32_t generation);

            // "ab/cd/ef/<uuid>", the common stem of every file of a node
            static std::string node_base_path(const NodeId& id);
            static std::string node_folder_path(const NodeId& id);

        private:
            NameIndex& names_;
            BlobStore& blobs_;
            uint32_t min_blob_size_;
        };

    }
}
