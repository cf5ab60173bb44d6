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
#include <vector>

namespace burrow {
    namespace journal {

        // One journal entry; immutable once appended
        struct Record {
            int64_t revision = 0;
            std::string journal_id;     // cluster member that appended it
            std::string producer_id;    // subsystem that produced the payload
            std::vector<uint8_t> data;
        };

        /**
         * Forward, single-pass sequence of records in ascending revision
         * order. next() past the end throws JournalError.
         */
        class RecordIterator {
        public:
            virtual ~RecordIterator() = default;
            virtual bool has_next() = 0;
            virtual Record next() = 0;
        };

    }
}
