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
#include <vector>
#include "../persistence/persistence_manager.h"

namespace burrow {
    namespace journal {

        namespace change_record {
            constexpr uint32_t kMagic = 0x47484342;     // "BCHG"
            constexpr uint8_t  kVersion = 1;
            constexpr const char* kProducerId = "PM";
        }

        /**
         * Journal payload of one save: the bundles stored and destroyed and
         * the references records stored and destroyed.
         *
         * Unlike the bundle format, names are written out and every value is
         * inline, so a record decodes without the name index or blob store
         * of the member that produced it. A CRC32C trailer guards the body.
         */
        class ChangeRecord {
        public:
            static std::vector<uint8_t> encode(const persist::ChangeSet& changes);

            // Throws JournalError on a truncated or corrupt payload
            static persist::ChangeSet decode(const std::vector<uint8_t>& data);
        };

    }
}
