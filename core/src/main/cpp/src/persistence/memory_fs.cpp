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

#include "memory_fs.h"
#include <algorithm>
#include <cerrno>

namespace burrow {
    namespace persist {

        void MemoryFileSystem::init() {
            std::lock_guard<std::mutex> lock(mu_);
            folders_.insert(std::string());
        }

        void MemoryFileSystem::close() {
            // contents survive close, like files on disk
        }

        bool MemoryFileSystem::exists(const std::string& path) const {
            std::lock_guard<std::mutex> lock(mu_);
            return files_.count(path) != 0 || folders_.count(path) != 0;
        }

        bool MemoryFileSystem::is_folder(const std::string& path) const {
            std::lock_guard<std::mutex> lock(mu_);
            return folders_.count(path) != 0;
        }

        void MemoryFileSystem::create_folder(const std::string& path) {
            std::lock_guard<std::mutex> lock(mu_);
            std::string p = path;
            while (!p.empty() && folders_.insert(p).second) {
                if (files_.count(p)) {
                    folders_.erase(p);
                    throw FileSystemError("create folder " + path + ": file in the way", EEXIST);
                }
                p = parent_of(p);
            }
            folders_.insert(std::string());
        }

        std::vector<uint8_t> MemoryFileSystem::read(const std::string& path) const {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = files_.find(path);
            if (it == files_.end()) {
                throw FileSystemError("read " + path + ": no such file", ENOENT);
            }
            return it->second;
        }

        void MemoryFileSystem::write(const std::string& path, const void* data, size_t len) {
            std::lock_guard<std::mutex> lock(mu_);
            if (folders_.count(parent_of(path)) == 0) {
                throw FileSystemError("write " + path + ": no such folder", ENOENT);
            }
            if (folders_.count(path)) {
                throw FileSystemError("write " + path + ": is a folder", EISDIR);
            }
            const uint8_t* p = static_cast<const uint8_t*>(data);
            files_[path].assign(p, p + len);
        }

        void MemoryFileSystem::remove(const std::string& path) {
            std::lock_guard<std::mutex> lock(mu_);
            if (files_.erase(path) == 0) {
                throw FileSystemError("remove " + path + ": no such file", ENOENT);
            }
        }

        size_t MemoryFileSystem::size(const std::string& path) const {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = files_.find(path);
            if (it == files_.end()) {
                throw FileSystemError("stat " + path + ": no such file", ENOENT);
            }
            return it->second.size();
        }

        std::vector<std::string> MemoryFileSystem::list(const std::string& folder) const {
            std::lock_guard<std::mutex> lock(mu_);
            if (folders_.count(folder) == 0) {
                throw FileSystemError("list " + folder + ": no such folder", ENOENT);
            }
            std::vector<std::string> names;
            auto child_name = [&](const std::string& p) -> bool {
                if (p.empty() || parent_of(p) != folder) return false;
                names.push_back(folder.empty() ? p : p.substr(folder.size() + 1));
                return true;
            };
            for (const auto& f : folders_) child_name(f);
            for (const auto& f : files_) child_name(f.first);
            std::sort(names.begin(), names.end());
            return names;
        }

        size_t MemoryFileSystem::file_count() const {
            std::lock_guard<std::mutex> lock(mu_);
            return files_.size();
        }

    }
}
