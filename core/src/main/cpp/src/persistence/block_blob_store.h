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
#include <mutex>
#include <string>
#include <unordered_map>
#include "blob_store.h"
#include "config.h"

namespace burrow {
    namespace persist {

        /**
         * Embedded block store: every blob lives in one append-only container
         * file. Each put or remove appends a frame starting on a block
         * boundary:
         *
         *   magic(4) type(1) pad(3) id_len(4) data_len(8) data_crc(4) header_crc(4)
         *   id bytes, data bytes (put only)
         *
         * header_crc covers the first 24 header bytes and the id. The index
         * is rebuilt at open by replaying frames; replay stops at the first
         * torn or corrupt frame and the file is truncated there.
         *
         * Overwritten blobs and tombstones leave dead frames behind. Once
         * they pass kCompactMinDeadBytes and outweigh the live frames the
         * live ones are copied into a new container that replaces the old
         * file; this is checked at open and after every remove.
         */
        class BlockBlobStore final : public BlobStore {
        public:
            BlockBlobStore(const std::string& dir, uint32_t block_size, bool sync_writes = true);
            ~BlockBlobStore() override;

            BlockBlobStore(const BlockBlobStore&) = delete;
            BlockBlobStore& operator=(const BlockBlobStore&) = delete;

            void open();

            void put(const std::string& blob_id, const std::vector<uint8_t>& data) override;
            std::vector<uint8_t> get(const std::string& blob_id) const override;
            bool remove(const std::string& blob_id) override;
            bool exists(const std::string& blob_id) const override;
            bool holds(const std::string& blob_id, const std::vector<uint8_t>& data) const override;
            void close() override;

            // Rewrites the container with live frames only; returns the bytes reclaimed
            uint64_t compact();

            size_t blob_count() const;
            uint64_t end_offset() const;
            uint64_t dead_bytes() const;

        private:
            struct Location {
                uint64_t offset;        // of the data bytes
                uint64_t length;
                uint32_t crc;
                uint64_t span;          // whole frame, block aligned
            };

            void replay_locked();
            uint64_t compact_locked();
            void maybe_compact_locked();
            uint64_t frame_span(const std::string& blob_id, uint64_t data_len) const {
                return align_up(block_store::kFrameHeaderSize + blob_id.size() + data_len);
            }
            uint64_t append_frame_locked(uint8_t type, const std::string& blob_id,
                                         const std::vector<uint8_t>* data);
            uint64_t align_up(uint64_t v) const {
                return (v + block_size_ - 1) & ~static_cast<uint64_t>(block_size_ - 1);
            }
            void ensure_open() const;

            std::string dir_;
            std::string path_;
            uint32_t block_size_;
            bool sync_;
            int fd_ = -1;
            uint64_t end_ = 0;
            uint64_t live_bytes_ = 0;
            mutable std::mutex mu_;
            std::unordered_map<std::string, Location> index_;
        };

    }
}
