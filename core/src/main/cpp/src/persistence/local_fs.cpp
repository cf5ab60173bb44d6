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

#include "local_fs.h"
#include "platform_fs.h"
#include "config.h"
#include "../util/log.h"
#include <algorithm>
#include <cstring>

namespace burrow {
    namespace persist {

        namespace {
            [[noreturn]] void fail(const char* op, const std::string& path, int err) {
                throw FileSystemError(std::string(op) + " " + path + ": " + std::strerror(err), err);
            }

            bool ends_with(const std::string& s, const char* suffix) {
                size_t n = std::strlen(suffix);
                return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
            }
        }

        void LocalFileSystem::init() {
            FSResult r = PlatformFS::ensure_directory(root_);
            if (!r.ok) {
                fail("create root", root_, r.err);
            }
            debug() << "local item filesystem at " << root_;
        }

        bool LocalFileSystem::exists(const std::string& path) const {
            return PlatformFS::exists(full_path(path));
        }

        bool LocalFileSystem::is_folder(const std::string& path) const {
            return PlatformFS::is_directory(full_path(path));
        }

        void LocalFileSystem::create_folder(const std::string& path) {
            FSResult r = PlatformFS::ensure_directory(full_path(path));
            if (!r.ok) {
                fail("create folder", path, r.err);
            }
        }

        std::vector<uint8_t> LocalFileSystem::read(const std::string& path) const {
            std::vector<uint8_t> out;
            FSResult r = PlatformFS::read_file(full_path(path), &out);
            if (!r.ok) {
                fail("read", path, r.err);
            }
            return out;
        }

        void LocalFileSystem::write(const std::string& path, const void* data, size_t len) {
            const std::string final_path = full_path(path);
            const std::string tmp_path = final_path + files::kTempSuffix;

            FSResult r = PlatformFS::write_file(tmp_path, data, len, sync_);
            if (!r.ok) {
                fail("write", path, r.err);
            }

            r = PlatformFS::atomic_replace(tmp_path, final_path);
            if (!r.ok) {
                FSResult cleanup = PlatformFS::remove_file(tmp_path);
                if (!cleanup.ok && cleanup.err != ENOENT) {
                    warning() << "could not remove " << tmp_path << ": " << errnoWithDescription(cleanup.err);
                }
                fail("publish", path, r.err);
            }
        }

        void LocalFileSystem::remove(const std::string& path) {
            FSResult r = PlatformFS::remove_file(full_path(path));
            if (!r.ok) {
                fail("remove", path, r.err);
            }
        }

        size_t LocalFileSystem::size(const std::string& path) const {
            auto r = PlatformFS::file_size(full_path(path));
            if (!r.first.ok) {
                fail("stat", path, r.first.err);
            }
            return r.second;
        }

        std::vector<std::string> LocalFileSystem::list(const std::string& folder) const {
            std::vector<std::string> names;
            FSResult r = PlatformFS::list_directory(full_path(folder), &names);
            if (!r.ok) {
                fail("list", folder, r.err);
            }
            // half-written temp files are not items
            names.erase(std::remove_if(names.begin(), names.end(),
                                       [](const std::string& n) { return ends_with(n, files::kTempSuffix); }),
                        names.end());
            std::sort(names.begin(), names.end());
            return names;
        }

    }
}
