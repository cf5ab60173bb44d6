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
#include <cstring>
#include <boost/endian/conversion.hpp>

namespace burrow {
namespace util {

    // Every on-disk and journal format is little-endian whatever the host order.

    inline void store_le16(uint8_t* buf, uint16_t val) { boost::endian::store_little_u16(buf, val); }
    inline void store_le32(uint8_t* buf, uint32_t val) { boost::endian::store_little_u32(buf, val); }
    inline void store_le64(uint8_t* buf, uint64_t val) { boost::endian::store_little_u64(buf, val); }

    inline uint16_t load_le16(const uint8_t* buf) { return boost::endian::load_little_u16(buf); }
    inline uint32_t load_le32(const uint8_t* buf) { return boost::endian::load_little_u32(buf); }
    inline uint64_t load_le64(const uint8_t* buf) { return boost::endian::load_little_u64(buf); }

    // doubles travel as their IEEE 754 bit pattern
    inline void store_lef64(uint8_t* buf, double val) {
        uint64_t bits;
        std::memcpy(&bits, &val, sizeof(bits));
        store_le64(buf, bits);
    }

    inline double load_lef64(const uint8_t* buf) {
        uint64_t bits = load_le64(buf);
        double val;
        std::memcpy(&val, &bits, sizeof(val));
        return val;
    }

} // namespace util
} // namespace burrow
