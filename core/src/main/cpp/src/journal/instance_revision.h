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
#include <string>

namespace burrow {
    namespace journal {

        /**
         * Last journal revision a cluster member has applied.
         *
         * With a path the value is kept in an 8-byte little-endian file,
         * replaced atomically on every set(); a missing file reads as 0.
         * Without a path it lives in memory only.
         */
        class InstanceRevision {
        public:
            explicit InstanceRevision(const std::string& path = std::string(), bool sync = true);

            // Reads the persisted value; throws JournalError if the file is corrupt
            void open();

            int64_t get() const { return revision_; }

            // Throws JournalError when the file cannot be written
            void set(int64_t revision);

            const std::string& path() const { return path_; }

        private:
            std::string path_;
            bool sync_;
            int64_t revision_ = 0;
        };

    }
}
