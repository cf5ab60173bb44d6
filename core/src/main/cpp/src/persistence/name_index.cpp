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

#include "name_index.h"
#include "checksums.h"
#include "config.h"
#include "../util/byte_stream.h"
#include "../util/log.h"

namespace burrow {
    namespace persist {

        void NameIndex::load() {
            std::lock_guard<std::mutex> lock(mu_);
            names_.clear();
            index_.clear();

            if (!fs_.exists(path_)) {
                debug() << "name index " << path_ << " not found, starting empty";
                return;
            }

            std::vector<uint8_t> data = fs_.read(path_);
            if (data.size() < 4) {
                throw ItemStateError("name index " + path_ + " truncated");
            }
            const size_t body = data.size() - 4;
            uint32_t stored_crc = util::load_le32(data.data() + body);
            if (crc32c(data.data(), body) != stored_crc) {
                throw ItemStateError("name index " + path_ + " checksum mismatch");
            }

            try {
                util::ByteReader in(data.data(), body);
                if (in.u32() != name_index::kMagic) {
                    throw ItemStateError("name index " + path_ + " has bad magic");
                }
                uint8_t version = in.u8();
                if (version != name_index::kVersion) {
                    throw ItemStateError("name index " + path_ + " has unsupported version " +
                                         std::to_string(version));
                }
                uint32_t count = in.u32();
                names_.reserve(count);
                for (uint32_t i = 0; i < count; ++i) {
                    std::string n = in.str();
                    index_.emplace(n, i);
                    names_.push_back(std::move(n));
                }
            } catch (const std::out_of_range& e) {
                throw ItemStateError("name index " + path_ + " malformed", e);
            }

            debug() << "loaded " << names_.size() << " names from " << path_;
        }

        uint32_t NameIndex::index_of(const std::string& name) {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = index_.find(name);
            if (it != index_.end()) {
                return it->second;
            }

            uint32_t idx = static_cast<uint32_t>(names_.size());
            names_.push_back(name);
            index_.emplace(name, idx);
            try {
                save_locked();
            } catch (const std::exception&) {
                names_.pop_back();
                index_.erase(name);
                throw;
            }
            return idx;
        }

        std::string NameIndex::name_of(uint32_t index) const {
            std::lock_guard<std::mutex> lock(mu_);
            if (index >= names_.size()) {
                throw NoSuchItemStateError("no name with index " + std::to_string(index));
            }
            return names_[index];
        }

        bool NameIndex::contains(const std::string& name) const {
            std::lock_guard<std::mutex> lock(mu_);
            return index_.count(name) != 0;
        }

        size_t NameIndex::size() const {
            std::lock_guard<std::mutex> lock(mu_);
            return names_.size();
        }

        void NameIndex::save_locked() {
            util::ByteWriter out;
            out.u32(name_index::kMagic);
            out.u8(name_index::kVersion);
            out.u32(static_cast<uint32_t>(names_.size()));
            for (const auto& n : names_) {
                out.str(n);
            }
            out.u32(crc32c(out.buffer().data(), out.size()));

            try {
                fs_.create_folder(ItemFileSystem::parent_of(path_));
                fs_.write(path_, out.buffer());
            } catch (const FileSystemError& e) {
                error() << "failed to write name index " << path_ << ": " << e.what();
                throw ItemStateError("failed to write name index " + path_, e);
            }
        }

    }
}
