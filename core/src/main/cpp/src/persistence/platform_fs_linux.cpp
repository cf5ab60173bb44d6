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

#include "platform_fs.h"

#include <unistd.h>
#include <fcntl.h>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <filesystem>
#include <cerrno>
#include <cstring>

namespace burrow {
    namespace persist {

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
            if (fd < 0) {
                return {false, errno};
            }

            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }

            std::filesystem::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        FSResult PlatformFS::write_file(const std::string& path, const void* data, size_t len,
                                        bool sync) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            FSResult res = pwrite_all(fd, data, len, 0);
            if (res.ok && sync && ::fdatasync(fd) != 0) {
                res = {false, errno};
            }
            if (::close(fd) != 0 && res.ok) {
                res = {false, errno};
            }
            return res;
        }

        FSResult PlatformFS::read_file(const std::string& path, std::vector<uint8_t>* out) {
            int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }

            struct stat st{};
            if (::fstat(fd, &st) != 0) {
                int e = errno;
                ::close(fd);
                return {false, e};
            }

            out->resize(static_cast<size_t>(st.st_size));
            FSResult res = pread_all(fd, out->data(), out->size(), 0);
            ::close(fd);
            return res;
        }

        FSResult PlatformFS::pwrite_all(int fd, const void* data, size_t len, uint64_t offset) {
            const uint8_t* p = static_cast<const uint8_t*>(data);
            while (len > 0) {
                ssize_t n = ::pwrite(fd, p, len, static_cast<off_t>(offset));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                p += n;
                len -= static_cast<size_t>(n);
                offset += static_cast<uint64_t>(n);
            }
            return {true, 0};
        }

        FSResult PlatformFS::pread_all(int fd, void* data, size_t len, uint64_t offset) {
            uint8_t* p = static_cast<uint8_t*>(data);
            while (len > 0) {
                ssize_t n = ::pread(fd, p, len, static_cast<off_t>(offset));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                if (n == 0) {
                    // file shorter than expected
                    return {false, EIO};
                }
                p += n;
                len -= static_cast<size_t>(n);
                offset += static_cast<uint64_t>(n);
            }
            return {true, 0};
        }

        FSResult PlatformFS::remove_file(const std::string& path) {
            if (::unlink(path.c_str()) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::remove_directory(const std::string& path) {
            if (::rmdir(path.c_str()) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        bool PlatformFS::exists(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0;
        }

        bool PlatformFS::is_directory(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec) {
                if (std::filesystem::is_directory(path)) {
                    return {true, 0};
                }
                return {false, ec.value() != 0 ? ec.value() : EIO};
            }
            return {true, 0};
        }

        FSResult PlatformFS::list_directory(const std::string& path, std::vector<std::string>* names) {
            DIR* dir = ::opendir(path.c_str());
            if (!dir) {
                return {false, errno};
            }
            names->clear();
            errno = 0;
            while (struct dirent* ent = ::readdir(dir)) {
                if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0) {
                    continue;
                }
                names->emplace_back(ent->d_name);
            }
            int e = errno;
            ::closedir(dir);
            return {e == 0, e};
        }

    } // namespace persist
} // namespace burrow
