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
#include <vector>
#include "../errors.h"

namespace burrow {
    namespace persist {

        /**
         * Folder/key addressed physical store used by the bundle persistence
         * manager. Paths are relative, '/' separated, without a leading slash.
         *
         * Failures throw FileSystemError; a missing file reports ENOENT so
         * callers can tell "absent" from other I/O failures.
         */
        class ItemFileSystem {
        public:
            virtual ~ItemFileSystem() = default;

            virtual void init() = 0;
            virtual void close() = 0;

            virtual bool exists(const std::string& path) const = 0;
            virtual bool is_folder(const std::string& path) const = 0;

            // Creates the folder and any missing parents
            virtual void create_folder(const std::string& path) = 0;

            virtual std::vector<uint8_t> read(const std::string& path) const = 0;

            // Replaces the file atomically; readers see the old or the new bytes
            virtual void write(const std::string& path, const void* data, size_t len) = 0;

            void write(const std::string& path, const std::vector<uint8_t>& data) {
                write(path, data.data(), data.size());
            }

            virtual void remove(const std::string& path) = 0;

            virtual size_t size(const std::string& path) const = 0;

            // Names of the direct children of folder
            virtual std::vector<std::string> list(const std::string& folder) const = 0;

            static std::string parent_of(const std::string& path) {
                size_t pos = path.rfind('/');
                return pos == std::string::npos ? std::string() : path.substr(0, pos);
            }

            static std::string join(const std::string& folder, const std::string& name) {
                if (folder.empty()) return name;
                if (name.empty()) return folder;
                return folder + "/" + name;
            }
        };

    }
}
