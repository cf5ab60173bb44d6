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
#include <cstddef>
#include <cstdint>
#include <vector>

namespace burrow {
namespace persist {

    /**
     * Incremental CRC32C (Castagnoli, reflected 0x82F63B78). Seals bundle
     * and references records, name index files, block store frames and
     * journal change records.
     */
    class CRC32C {
    public:
        CRC32C() : state_(0xFFFFFFFFu) {}

        void update(const void* data, size_t len);
        void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

        uint32_t finalize() const { return ~state_; }
        void reset() { state_ = 0xFFFFFFFFu; }

        static uint32_t compute(const void* data, size_t len);
        static uint32_t compute(const std::vector<uint8_t>& data) { return compute(data.data(), data.size()); }

    private:
        uint32_t state_;
    };

    inline uint32_t crc32c(const void* data, size_t len) {
        return CRC32C::compute(data, len);
    }

} // namespace persist
} // namespace burrow
