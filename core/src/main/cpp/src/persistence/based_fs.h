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

        /**
         * View of a sub-folder of another filesystem. Does not own base;
         * init creates the sub-folder, close leaves base open.
         */
        class BasedFileSystem final : public ItemFileSystem {
        public:
            BasedFileSystem(ItemFileSystem& base, const std::string& folder)
                : base_(base), folder_(folder) {}

            void init() override { base_.create_folder(folder_); }
            void close() override {}

            bool exists(const std::string& path) const override { return base_.exists(map(path)); }
            bool is_folder(const std::string& path) const override { return base_.is_folder(map(path)); }
            void create_folder(const std::string& path) override { base_.create_folder(map(path)); }
            std::vector<uint8_t> read(const std::string& path) const override { return base_.read(map(path)); }
            void write(const std::string& path, const void* data, size_t len) override {
                base_.write(map(path), data, len);
            }
            using ItemFileSystem::write;
            void remove(const std::string& path) override { base_.remove(map(path)); }
            size_t size(const std::string& path) const override { return base_.size(map(path)); }
            std::vector<std::string> list(const std::string& folder) const override {
                return base_.list(map(folder));
            }

            const std::string& folder() const { return folder_; }

        private:
            std::string map(const std::string& path) const { return join(folder_, path); }

            ItemFileSystem& base_;
            std::string folder_;
        };

    }
}
