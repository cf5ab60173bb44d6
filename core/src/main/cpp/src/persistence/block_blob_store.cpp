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

#include "block_blob_store.h"
#include "platform_fs.h"
#include "checksums.h"
#include "config.h"
#include "../util/endian.hpp"
#include "../util/log.h"

#include <algorithm>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace burrow {
    namespace persist {

        using namespace burrow::util;
        using block_store::kFrameHeaderSize;

        static_assert(kFrameHeaderSize == 28, "block store frame header size mismatch");

        // Layout: magic(4) | type(1) | pad(3) | id_len(4) | data_len(8) | data_crc(4) | header_crc(4)
        static void serialize_frame_header(uint8_t* buf, uint8_t type, uint32_t id_len,
                                           uint64_t data_len, uint32_t data_crc) {
            std::memset(buf, 0, kFrameHeaderSize);
            store_le32(buf, block_store::kFrameMagic);
            buf[4] = type;
            store_le32(buf + 8, id_len);
            store_le64(buf + 12, data_len);
            store_le32(buf + 20, data_crc);
        }

        static uint32_t header_crc(const uint8_t* header, const std::string& blob_id) {
            CRC32C c;
            c.update(header, 24);
            c.update(blob_id.data(), blob_id.size());
            return c.finalize();
        }

        // Writes header, id and data of one frame at off
        static FSResult write_frame(int fd, uint64_t off, uint8_t type, const std::string& blob_id,
                                    const std::vector<uint8_t>* data, uint32_t data_crc) {
            const uint64_t data_len = data ? data->size() : 0;
            std::vector<uint8_t> frame(kFrameHeaderSize + blob_id.size());
            serialize_frame_header(frame.data(), type, static_cast<uint32_t>(blob_id.size()),
                                   data_len, data_crc);
            std::memcpy(frame.data() + kFrameHeaderSize, blob_id.data(), blob_id.size());
            store_le32(frame.data() + 24, header_crc(frame.data(), blob_id));

            FSResult r = PlatformFS::pwrite_all(fd, frame.data(), frame.size(), off);
            if (r.ok && data_len > 0) {
                r = PlatformFS::pwrite_all(fd, data->data(), data->size(), off + frame.size());
            }
            return r;
        }

        BlockBlobStore::BlockBlobStore(const std::string& dir, uint32_t block_size, bool sync_writes)
            : dir_(dir), path_(dir + "/" + block_store::kContainerFile),
              block_size_(block_size), sync_(sync_writes) {
            if (block_size_ == 0 || (block_size_ & (block_size_ - 1)) != 0) {
                throw std::invalid_argument("block size must be a power of two: " +
                                            std::to_string(block_size));
            }
        }

        BlockBlobStore::~BlockBlobStore() {
            std::lock_guard<std::mutex> lock(mu_);
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }

        void BlockBlobStore::open() {
            std::lock_guard<std::mutex> lock(mu_);
            if (fd_ >= 0) {
                return;
            }

            FSResult r = PlatformFS::ensure_directory(dir_);
            if (!r.ok) {
                throw ItemStateError("cannot create block store directory " + dir_ + ": " +
                                     errnoWithDescription(r.err));
            }

            // left behind by a compaction that did not finish
            const std::string leftover = path_ + block_store::kCompactSuffix;
            if (PlatformFS::exists(leftover)) {
                warning() << "block store " << path_ << ": removing unfinished compaction " << leftover;
                FSResult rm = PlatformFS::remove_file(leftover);
                if (!rm.ok) {
                    throw ItemStateError("cannot remove " + leftover + ": " + errnoWithDescription(rm.err));
                }
            }

            fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
            if (fd_ < 0) {
                throw ItemStateError("cannot open block store " + path_ + ": " + errnoWithDescription());
            }

            try {
                replay_locked();
            } catch (const std::exception&) {
                ::close(fd_);
                fd_ = -1;
                throw;
            }
            maybe_compact_locked();
        }

        void BlockBlobStore::replay_locked() {
            index_.clear();
            live_bytes_ = 0;

            auto sz = PlatformFS::file_size(path_);
            if (!sz.first.ok) {
                throw ItemStateError("cannot stat block store " + path_ + ": " +
                                     errnoWithDescription(sz.first.err));
            }
            const uint64_t file_size = sz.second;

            uint64_t off = 0;
            size_t frames = 0;
            uint8_t header[kFrameHeaderSize];

            while (off + kFrameHeaderSize <= file_size) {
                if (!PlatformFS::pread_all(fd_, header, kFrameHeaderSize, off).ok) {
                    break;
                }
                if (load_le32(header) != block_store::kFrameMagic) {
                    break;
                }
                uint8_t type = header[4];
                uint32_t id_len = load_le32(header + 8);
                uint64_t data_len = load_le64(header + 12);
                uint32_t data_crc = load_le32(header + 20);
                uint32_t stored_hcrc = load_le32(header + 24);

                uint64_t frame_end = off + kFrameHeaderSize + id_len + data_len;
                if (frame_end > file_size || frame_end < off) {
                    break;
                }

                std::string blob_id(id_len, '\0');
                if (id_len > 0 && !PlatformFS::pread_all(fd_, &blob_id[0], id_len, off + kFrameHeaderSize).ok) {
                    break;
                }
                if (header_crc(header, blob_id) != stored_hcrc) {
                    break;
                }

                if (type != block_store::kFramePut && type != block_store::kFrameTombstone) {
                    break;
                }
                auto it = index_.find(blob_id);
                if (it != index_.end()) {
                    live_bytes_ -= it->second.span;
                    index_.erase(it);
                }
                if (type == block_store::kFramePut) {
                    const uint64_t span = align_up(frame_end) - off;
                    index_[blob_id] = Location{off + kFrameHeaderSize + id_len, data_len, data_crc, span};
                    live_bytes_ += span;
                }

                ++frames;
                off = align_up(frame_end);
            }

            if (off < file_size) {
                warning() << "block store " << path_ << ": discarding " << (file_size - off)
                          << " bytes after the last valid frame";
                if (::ftruncate(fd_, static_cast<off_t>(off)) != 0) {
                    throw ItemStateError("cannot truncate block store " + path_ + ": " + errnoWithDescription());
                }
            }
            end_ = off;

            debug() << "block store " << path_ << ": replayed " << frames << " frames, "
                    << index_.size() << " live blobs, " << (end_ - live_bytes_) << " dead bytes";
        }

        uint64_t BlockBlobStore::append_frame_locked(uint8_t type, const std::string& blob_id,
                                                     const std::vector<uint8_t>* data) {
            const uint64_t data_len = data ? data->size() : 0;
            const uint32_t data_crc = data ? crc32c(data->data(), data->size()) : 0;

            const uint64_t off = end_;
            FSResult r = write_frame(fd_, off, type, blob_id, data, data_crc);
            if (r.ok && sync_ && ::fdatasync(fd_) != 0) {
                r = {false, errno};
            }
            if (!r.ok) {
                // end_ is unchanged; the next frame overwrites the partial one
                throw ItemStateError("block store append to " + path_ + " failed: " +
                                     errnoWithDescription(r.err));
            }

            end_ = off + frame_span(blob_id, data_len);
            return off + kFrameHeaderSize + blob_id.size();
        }

        uint64_t BlockBlobStore::compact_locked() {
            const std::string tmp = path_ + block_store::kCompactSuffix;
            int fd = ::open(tmp.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                throw ItemStateError("cannot create " + tmp + ": " + errnoWithDescription());
            }

            // copy live frames in file order; data and checksums move unchanged
            std::vector<std::pair<std::string, Location>> live(index_.begin(), index_.end());
            std::sort(live.begin(), live.end(), [](const std::pair<std::string, Location>& a,
                                                   const std::pair<std::string, Location>& b) {
                return a.second.offset < b.second.offset;
            });

            std::unordered_map<std::string, Location> moved;
            uint64_t off = 0;
            try {
                std::vector<uint8_t> data;
                for (const auto& e : live) {
                    const std::string& id = e.first;
                    const Location& loc = e.second;
                    data.resize(loc.length);
                    FSResult r{true, 0};
                    if (!data.empty()) {
                        r = PlatformFS::pread_all(fd_, data.data(), data.size(), loc.offset);
                    }
                    if (r.ok) {
                        r = write_frame(fd, off, block_store::kFramePut, id, &data, loc.crc);
                    }
                    if (!r.ok) {
                        throw ItemStateError("compaction of " + path_ + " failed at blob " + id + ": " +
                                             errnoWithDescription(r.err));
                    }
                    const uint64_t span = frame_span(id, loc.length);
                    moved[id] = Location{off + kFrameHeaderSize + id.size(), loc.length, loc.crc, span};
                    off += span;
                }
                if (sync_ && ::fdatasync(fd) != 0) {
                    throw ItemStateError("compaction of " + path_ + " failed: " + errnoWithDescription());
                }
                FSResult r = PlatformFS::atomic_replace(tmp, path_);
                if (!r.ok) {
                    if (PlatformFS::exists(tmp)) {
                        throw ItemStateError("cannot replace " + path_ + ": " + errnoWithDescription(r.err));
                    }
                    warning() << "block store " << path_ << ": directory sync after compaction failed: "
                              << errnoWithDescription(r.err);
                }
            } catch (const std::exception&) {
                ::close(fd);
                FSResult rm = PlatformFS::remove_file(tmp);
                if (!rm.ok) {
                    warning() << "cannot remove " << tmp << ": " << errnoWithDescription(rm.err);
                }
                throw;
            }

            ::close(fd_);
            fd_ = fd;
            const uint64_t reclaimed = end_ - off;
            index_.swap(moved);
            end_ = off;
            live_bytes_ = off;
            info() << "block store " << path_ << ": compacted " << index_.size() << " blobs, reclaimed "
                   << reclaimed << " bytes";
            return reclaimed;
        }

        void BlockBlobStore::maybe_compact_locked() {
            const uint64_t dead = end_ - live_bytes_;
            if (dead < block_store::kCompactMinDeadBytes || dead <= live_bytes_) {
                return;
            }
            try {
                compact_locked();
            } catch (const ItemStateError& e) {
                // the old container is still intact and in use
                warning() << "block store " << path_ << ": compaction skipped: " << e.what();
            }
        }

        uint64_t BlockBlobStore::compact() {
            std::lock_guard<std::mutex> lock(mu_);
            ensure_open();
            return compact_locked();
        }

        void BlockBlobStore::ensure_open() const {
            if (fd_ < 0) {
                throw InvalidItemStateError("block store " + path_ + " is not open");
            }
        }

        void BlockBlobStore::put(const std::string& blob_id, const std::vector<uint8_t>& data) {
            std::lock_guard<std::mutex> lock(mu_);
            ensure_open();
            uint64_t data_off = append_frame_locked(block_store::kFramePut, blob_id, &data);
            const uint64_t span = frame_span(blob_id, data.size());
            auto it = index_.find(blob_id);
            if (it != index_.end()) {
                live_bytes_ -= it->second.span;
            }
            index_[blob_id] = Location{data_off, data.size(), crc32c(data.data(), data.size()), span};
            live_bytes_ += span;
        }

        std::vector<uint8_t> BlockBlobStore::get(const std::string& blob_id) const {
            std::lock_guard<std::mutex> lock(mu_);
            ensure_open();
            auto it = index_.find(blob_id);
            if (it == index_.end()) {
                throw NoSuchItemStateError("blob " + blob_id + " not found");
            }

            std::vector<uint8_t> out(it->second.length);
            if (!out.empty()) {
                FSResult r = PlatformFS::pread_all(fd_, out.data(), out.size(), it->second.offset);
                if (!r.ok) {
                    throw ItemStateError("failed to read blob " + blob_id + ": " + errnoWithDescription(r.err));
                }
            }
            if (crc32c(out.data(), out.size()) != it->second.crc) {
                throw ItemStateError("blob " + blob_id + " checksum mismatch");
            }
            return out;
        }

        bool BlockBlobStore::remove(const std::string& blob_id) {
            std::lock_guard<std::mutex> lock(mu_);
            ensure_open();
            auto it = index_.find(blob_id);
            if (it == index_.end()) {
                return false;
            }
            append_frame_locked(block_store::kFrameTombstone, blob_id, nullptr);
            live_bytes_ -= it->second.span;
            index_.erase(it);
            maybe_compact_locked();
            return true;
        }

        bool BlockBlobStore::exists(const std::string& blob_id) const {
            std::lock_guard<std::mutex> lock(mu_);
            return index_.count(blob_id) != 0;
        }

        bool BlockBlobStore::holds(const std::string& blob_id, const std::vector<uint8_t>& data) const {
            {
                std::lock_guard<std::mutex> lock(mu_);
                auto it = index_.find(blob_id);
                if (it == index_.end() || it->second.length != data.size() ||
                    it->second.crc != crc32c(data.data(), data.size())) {
                    return false;
                }
            }
            return get(blob_id) == data;
        }

        void BlockBlobStore::close() {
            std::lock_guard<std::mutex> lock(mu_);
            if (fd_ < 0) {
                return;
            }
            if (sync_ && ::fsync(fd_) != 0) {
                warning() << "fsync of block store " << path_ << " failed: " << errnoWithDescription();
            }
            if (::close(fd_) != 0) {
                warning() << "close of block store " << path_ << " failed: " << errnoWithDescription();
            }
            fd_ = -1;
            index_.clear();
            live_bytes_ = 0;
        }

        size_t BlockBlobStore::blob_count() const {
            std::lock_guard<std::mutex> lock(mu_);
            return index_.size();
        }

        uint64_t BlockBlobStore::end_offset() const {
            std::lock_guard<std::mutex> lock(mu_);
            return end_;
        }

        uint64_t BlockBlobStore::dead_bytes() const {
            std::lock_guard<std::mutex> lock(mu_);
            return end_ - live_bytes_;
        }

    }
}
