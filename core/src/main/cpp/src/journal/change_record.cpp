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

#include "change_record.h"
#include "../errors.h"
#include "../persistence/checksums.h"
#include "../util/byte_stream.h"
#include <set>

namespace burrow {
    namespace journal {

        using persist::ChangeSet;
        using persist::InternalValue;
        using persist::NodeId;
        using persist::NodePropBundle;
        using persist::NodeReferences;
        using persist::PropertyEntry;
        using persist::PropertyId;
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

            void write_bundle(ByteWriter& out, const NodePropBundle& b) {
                write_id(out, b.id());
                write_id(out, b.parent_id());
                out.str(b.node_type());
                out.u32(static_cast<uint32_t>(b.mixins().size()));
                for (const auto& m : b.mixins()) {
                    out.str(m);
                }
                out.str(b.definition_id());
                out.u8(b.is_referenceable() ? 1 : 0);
                out.u16(b.mod_count());

                out.u32(static_cast<uint32_t>(b.child_entries().size()));
                for (const auto& c : b.child_entries()) {
                    out.str(c.name);
                    write_id(out, c.id);
                    out.u32(c.index);
                }

                out.u32(static_cast<uint32_t>(b.properties().size()));
                for (const auto& kv : b.properties()) {
                    const PropertyEntry& p = kv.second;
                    out.str(p.id.name);
                    out.u8(static_cast<uint8_t>(p.type));
                    out.u8(p.multi_valued ? 1 : 0);
                    out.str(p.definition_id);
                    out.u16(p.mod_count);
                    out.u32(static_cast<uint32_t>(p.values.size()));
                    for (const auto& v : p.values) {
                        out.bytes(v.to_bytes());
                    }
                }
            }

            NodePropBundle read_bundle(ByteReader& in) {
                NodePropBundle b(read_id(in));
                b.set_parent_id(read_id(in));
                b.set_node_type(in.str());
                std::set<std::string> mixins;
                for (uint32_t n = in.u32(); n > 0; --n) {
                    mixins.insert(in.str());
                }
                b.set_mixins(mixins);
                b.set_definition_id(in.str());
                b.set_referenceable(in.u8() != 0);
                b.set_mod_count(in.u16());

                for (uint32_t n = in.u32(); n > 0; --n) {
                    std::string name = in.str();
                    NodeId id = read_id(in);
                    b.add_child(name, id, in.u32());
                }

                for (uint32_t n = in.u32(); n > 0; --n) {
                    PropertyEntry p;
                    p.id = PropertyId(b.id(), in.str());
                    p.type = persist::property_type_from_tag(in.u8());
                    p.multi_valued = in.u8() != 0;
                    p.definition_id = in.str();
                    p.mod_count = in.u16();
                    for (uint32_t k = in.u32(); k > 0; --k) {
                        std::vector<uint8_t> raw = in.bytes();
                        p.values.push_back(InternalValue::from_bytes(p.type, raw.data(), raw.size()));
                    }
                    b.add_property(p);
                }
                return b;
            }
        }

        std::vector<uint8_t> ChangeRecord::encode(const ChangeSet& changes) {
            ByteWriter out;
            out.u32(change_record::kMagic);
            out.u8(change_record::kVersion);

            out.u32(static_cast<uint32_t>(changes.modified.size()));
            for (const auto& b : changes.modified) {
                write_bundle(out, b);
            }

            out.u32(static_cast<uint32_t>(changes.deleted.size()));
            for (const auto& id : changes.deleted) {
                write_id(out, id);
            }

            out.u32(static_cast<uint32_t>(changes.modified_refs.size()));
            for (const auto& r : changes.modified_refs) {
                write_id(out, r.target_id());
                out.u32(static_cast<uint32_t>(r.references().size()));
                for (const auto& p : r.references()) {
                    write_id(out, p.parent);
                    out.str(p.name);
                }
            }

            out.u32(static_cast<uint32_t>(changes.deleted_refs.size()));
            for (const auto& id : changes.deleted_refs) {
                write_id(out, id);
            }

            out.u32(persist::crc32c(out.buffer().data(), out.size()));
            return out.release();
        }

        ChangeSet ChangeRecord::decode(const std::vector<uint8_t>& data) {
            if (data.size() < 9) {
                throw JournalError("change record truncated (" + std::to_string(data.size()) + " bytes)");
            }
            const size_t body = data.size() - 4;
            if (persist::crc32c(data.data(), body) != util::load_le32(data.data() + body)) {
                throw JournalError("change record checksum mismatch");
            }

            ChangeSet changes;
            try {
                ByteReader in(data.data(), body);
                if (in.u32() != change_record::kMagic) {
                    throw JournalError("not a change record");
                }
                uint8_t version = in.u8();
                if (version != change_record::kVersion) {
                    throw JournalError("unsupported change record version " + std::to_string(version));
                }

                for (uint32_t n = in.u32(); n > 0; --n) {
                    changes.modified.push_back(read_bundle(in));
                }
                for (uint32_t n = in.u32(); n > 0; --n) {
                    changes.deleted.push_back(read_id(in));
                }
                for (uint32_t n = in.u32(); n > 0; --n) {
                    NodeReferences refs(read_id(in));
                    for (uint32_t k = in.u32(); k > 0; --k) {
                        NodeId parent = read_id(in);
                        refs.add_reference(PropertyId(parent, in.str()));
                    }
                    changes.modified_refs.push_back(refs);
                }
                for (uint32_t n = in.u32(); n > 0; --n) {
                    changes.deleted_refs.push_back(read_id(in));
                }
            } catch (const std::out_of_range& e) {
                throw JournalError("change record corrupt", e);
            } catch (const std::invalid_argument& e) {
                throw JournalError("change record corrupt", e);
            }
            return changes;
        }

    }
}
