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

#include "bundle_binding.h"
#include "checksums.h"
#include "config.h"
#include "../util/byte_stream.h"
#include "../util/log.h"
#include <set>

namespace burrow {
    namespace persist {

        using util::ByteReader;
        using util::ByteWriter;

        namespace {
            void write_id(ByteWriter& out, const NodeId& id) {
                uint8_t b[NodeId::kSize];
                id.to_bytes(b);
                out.raw(b, sizeof(b));
            }

            NodeId read_id(ByteReader& in) {
                uint8_t b[NodeId::kSize];
                in.raw(b, sizeof(b));
                return NodeId::from_bytes(b);
            }

            void seal(ByteWriter& out) {
                out.u32(crc32c(out.buffer().data(), out.size()));
            }

            // Verifies the trailing checksum and returns the body length
            size_t check_seal(const std::vector<uint8_t>& data, const char* what) {
                if (data.size() < 4) {
                    throw ItemStateError(std::string(what) + " record truncated");
                }
                size_t body = data.size() - 4;
                if (crc32c(data.data(), body) != util::load_le32(data.data() + body)) {
                    throw ItemStateError(std::string(what) + " record checksum mismatch");
                }
                return body;
            }
        }

        std::string BundleBinding::node_base_path(const NodeId& id) {
            std::string s = id.to_string();
            std::string p;
            p.reserve(s.size() + 9);
            p.append(s, 0, 2).push_back('/');
            p.append(s, 2, 2).push_back('/');
            p.append(s, 4, 2).push_back('/');
            p.append(s);
            return p;
        }

        std::string BundleBinding::node_folder_path(const NodeId& id) {
            return ItemFileSystem::parent_of(node_base_path(id));
        }

        std::string BundleBinding::blob_id(const PropertyId& id, size_t index, uint32_t generation) {
            char hex[16];
            std::snprintf(hex, sizeof(hex), "%x", names_.index_of(id.name));
            return node_base_path(id.parent) + "." + hex + "." + std::to_string(index) + "." +
                   std::to_string(generation) + "." + files::kBlobSuffix;
        }

        std::vector<uint8_t> BundleBinding::write_bundle(NodePropBundle& bundle, const NodePropBundle* stored,
                                                         std::vector<std::string>* written) {
            std::set<std::string> in_use;
            if (stored) {
                std::vector<std::string> ids = stored->blob_ids();
                in_use.insert(ids.begin(), ids.end());
            }

            ByteWriter out(bundle::kInitialBufferSize);
            out.u32(bundle::kMagic);
            out.u8(bundle::kVersion);
            write_id(out, bundle.id());
            write_id(out, bundle.parent_id());
            out.u32(names_.index_of(bundle.node_type()));

            out.u32(static_cast<uint32_t>(bundle.mixins().size()));
            for (const auto& m : bundle.mixins()) {
                out.u32(names_.index_of(m));
            }
            out.str(bundle.definition_id());

            out.u32(static_cast<uint32_t>(bundle.properties().size()));
            for (auto& kv : bundle.properties()) {
                PropertyEntry& p = kv.second;
                out.u32(names_.index_of(p.id.name));
                out.u8(static_cast<uint8_t>(p.type));
                out.u8(p.multi_valued ? kMultiValued : 0);
                out.str(p.definition_id);
                out.u16(p.mod_count);

                out.u32(static_cast<uint32_t>(p.values.size()));
                p.blob_ids.assign(p.values.size(), std::string());
                const PropertyEntry* old = stored ? stored->get_property(p.id.name) : nullptr;
                for (size_t i = 0; i < p.values.size(); ++i) {
                    const InternalValue& v = p.values[i];
                    if (v.serialized_size() >= min_blob_size_) {
                        std::vector<uint8_t> bytes = v.to_bytes();
                        std::string id;
                        if (old && old->is_blob(i) && blobs_.holds(old->blob_ids[i], bytes)) {
                            id = old->blob_ids[i];
                        } else {
                            uint32_t generation = bundle.mod_count();
                            id = blob_id(p.id, i, generation);
                            while (in_use.count(id)) {
                                id = blob_id(p.id, i, ++generation);
                            }
                            blobs_.put(id, bytes);
                            if (written) written->push_back(id);
                        }
                        p.blob_ids[i] = id;
                        out.u8(kBlob);
                        out.str(id);
                    } else {
                        out.u8(kInline);
                        out.bytes(v.to_bytes());
                    }
                }
            }

            out.u32(static_cast<uint32_t>(bundle.child_entries().size()));
            for (const auto& c : bundle.child_entries()) {
                out.u32(names_.index_of(c.name));
                write_id(out, c.id);
                out.u32(c.index);
            }

            out.u8(bundle.is_referenceable() ? 1 : 0);
            out.u16(bundle.mod_count());
            seal(out);
            return out.release();
        }

        NodePropBundle BundleBinding::read_bundle(const std::vector<uint8_t>& data, bool load_blobs) const {
            size_t body = check_seal(data, "bundle");

            try {
                ByteReader in(data.data(), body);
                if (in.u32() != bundle::kMagic) {
                    throw ItemStateError("bundle record has bad magic");
                }
                uint8_t version = in.u8();
                if (version != bundle::kVersion) {
                    throw ItemStateError("unsupported bundle version " + std::to_string(version));
                }

                NodePropBundle b(read_id(in));
                b.set_parent_id(read_id(in));
                b.set_node_type(names_.name_of(in.u32()));

                std::set<std::string> mixins;
                for (uint32_t n = in.u32(); n > 0; --n) {
                    mixins.insert(names_.name_of(in.u32()));
                }
                b.set_mixins(mixins);
                b.set_definition_id(in.str());

                for (uint32_t n = in.u32(); n > 0; --n) {
                    PropertyEntry p;
                    p.id = PropertyId(b.id(), names_.name_of(in.u32()));
                    p.type = property_type_from_tag(in.u8());
                    p.multi_valued = (in.u8() & kMultiValued) != 0;
                    p.definition_id = in.str();
                    p.mod_count = in.u16();

                    uint32_t count = in.u32();
                    p.values.reserve(count);
                    p.blob_ids.assign(count, std::string());
                    for (uint32_t i = 0; i < count; ++i) {
                        uint8_t kind = in.u8();
                        if (kind == kInline) {
                            std::vector<uint8_t> bytes = in.bytes();
                            p.values.push_back(InternalValue::from_bytes(p.type, bytes.data(), bytes.size()));
                        } else if (kind == kBlob) {
                            p.blob_ids[i] = in.str();
                            if (load_blobs) {
                                std::vector<uint8_t> bytes = blobs_.get(p.blob_ids[i]);
                                p.values.push_back(InternalValue::from_bytes(p.type, bytes.data(), bytes.size()));
                            } else {
                                p.values.push_back(InternalValue());
                            }
                        } else {
                            throw ItemStateError("unknown value kind " + std::to_string(kind) +
                                                 " in property " + p.id.to_string());
                        }
                    }
                    b.add_property(p);
                }

                for (uint32_t n = in.u32(); n > 0; --n) {
                    std::string name = names_.name_of(in.u32());
                    NodeId id = read_id(in);
                    uint32_t index = in.u32();
                    b.add_child(name, id, index);
                }

                b.set_referenceable(in.u8() != 0);
                b.set_mod_count(in.u16());

                if (!in.at_end()) {
                    throw ItemStateError("bundle " + b.id().to_string() + " has " +
                                         std::to_string(in.remaining()) + " trailing bytes");
                }
                b.set_size(data.size());
                return b;
            } catch (const std::out_of_range& e) {
                throw ItemStateError("malformed bundle record", e);
            } catch (const std::invalid_argument& e) {
                throw ItemStateError("malformed bundle record", e);
            }
        }

        std::vector<uint8_t> BundleBinding::write_references(const NodeReferences& refs) {
            ByteWriter out(256);
            out.u32(references::kMagic);
            out.u8(references::kVersion);
            write_id(out, refs.target_id());
            out.u32(static_cast<uint32_t>(refs.references().size()));
            for (const auto& p : refs.references()) {
                write_id(out, p.parent);
                out.u32(names_.index_of(p.name));
            }
            seal(out);
            return out.release();
        }

        NodeReferences BundleBinding::read_references(const std::vector<uint8_t>& data) const {
            size_t body = check_seal(data, "references");

            try {
                ByteReader in(data.data(), body);
                if (in.u32() != references::kMagic) {
                    throw ItemStateError("references record has bad magic");
                }
                uint8_t version = in.u8();
                if (version != references::kVersion) {
                    throw ItemStateError("unsupported references version " + std::to_string(version));
                }
                NodeReferences refs(read_id(in));
                for (uint32_t n = in.u32(); n > 0; --n) {
                    NodeId parent = read_id(in);
                    refs.add_reference(PropertyId(parent, names_.name_of(in.u32())));
                }
                return refs;
            } catch (const std::out_of_range& e) {
                throw ItemStateError("malformed references record", e);
            }
        }

    }
}
