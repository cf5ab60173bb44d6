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
#include <vector>
#include "item_fs.h"

namespace burrow {
    namespace persist {

        /**
         * Interns names to dense 32-bit indices shared by every bundle of a
         * store. A new name is persisted before its index is handed out, so
         * a bundle never references an index the file does not know.
         *
         * File layout: magic(4) version(1) count(4) {len(4) bytes}* crc32c(4)
         */
        class NameIndex {
        public:
            NameIndex(ItemFileSystem& fs, const std::string& path) : fs_(fs), path_(path) {}

            // Reads the index file when present; throws ItemStateError if corrupt
            void load();

            // Returns the index of name, assigning and persisting a new one if needed
            uint32_t index_of(const std::string& name);

            // Throws NoSuchItemStateError for an unknown index
            std::string name_of(uint32_t index) const;

            bool contains(const std::string& name) const;

            size_t size() const;

        private:
            void save_locked();

            ItemFileSystem& fs_;
            std::string path_;
            mutable std::mutex mu_;
            std::vector<std::string> names_;
            std::unordered_map<std::string, uint32_t> index_;
        };

    }
}
