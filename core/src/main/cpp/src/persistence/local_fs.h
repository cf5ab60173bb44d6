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
#include "item_fs.h"

namespace burrow {
    namespace persist {

        // Item filesystem rooted at a local directory.
        class LocalFileSystem final : public ItemFileSystem {
        public:
            explicit LocalFileSystem(const std::string& root, bool sync_writes = true)
                : root_(root), sync_(sync_writes) {}

            void init() override;
            void close() override {}

            bool exists(const std::string& path) const override;
            bool is_folder(const std::string& path) const override;
            void create_folder(const std::string& path) override;
            std::vector<uint8_t> read(const std::string& path) const override;
            void write(const std::string& path, const void* data, size_t len) override;
            using ItemFileSystem::write;
            void remove(const std::string& path) override;
            size_t size(const std::string& path) const override;
            std::vector<std::string> list(const std::string& folder) const override;

            const std::string& root() const { return root_; }

        private:
            std::string full_path(const std::string& path) const {
                return path.empty() ? root_ : root_ + "/" + path;
            }

            std::string root_;
            bool sync_;
        };

    }
}
