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
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace burrow {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Thin POSIX layer; every call reports errno instead of throwing.
        class PlatformFS {
        public:
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(tmp, final) followed by an fsync of the parent directory
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            // Writes the whole buffer to path (truncating), optionally fdatasync'd.
            static FSResult write_file(const std::string& path, const void* data, size_t len,
                                       bool sync);

            static FSResult read_file(const std::string& path, std::vector<uint8_t>* out);

            // Positional I/O on an already open descriptor
            static FSResult pwrite_all(int fd, const void* data, size_t len, uint64_t offset);
            static FSResult pread_all(int fd, void* data, size_t len, uint64_t offset);

            static FSResult remove_file(const std::string& path);
            static FSResult remove_directory(const std::string& path);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static bool exists(const std::string& path);
            static bool is_directory(const std::string& path);
            static FSResult ensure_directory(const std::string& path);
            static FSResult list_directory(const std::string& path, std::vector<std::string>* names);
        };

    }
} // namespace burrow::persist
