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

#include "checksums.h"
#include "../util/endian.hpp"

namespace burrow {
namespace persist {

    namespace {
        // slicing-by-8 lookup, built once on first use
        struct Crc32cTables {
            uint32_t t[8][256];

            Crc32cTables() {
                for (uint32_t i = 0; i < 256; ++i) {
                    uint32_t r = i;
                    for (int bit = 0; bit < 8; ++bit) {
                        r = (r & 1) ? (r >> 1) ^ 0x82F63B78u : r >> 1;
                    }
                    t[0][i] = r;
                }
                for (uint32_t i = 0; i < 256; ++i) {
                    for (int s = 1; s < 8; ++s) {
                        t[s][i] = (t[s - 1][i] >> 8) ^ t[0][t[s - 1][i] & 0xFF];
                    }
                }
            }
        };

        const Crc32cTables& tables() {
            static const Crc32cTables instance;
            return instance;
        }
    }

    void CRC32C::update(const void* data, size_t len) {
        if (len == 0) {
            return;
        }
        const uint32_t (*t)[256] = tables().t;
        const uint8_t* p = static_cast<const uint8_t*>(data);
        uint32_t crc = state_;

        for (; len >= 8; p += 8, len -= 8) {
            const uint32_t lo = util::load_le32(p) ^ crc;
            const uint32_t hi = util::load_le32(p + 4);
            crc = t[7][lo & 0xFF] ^ t[6][(lo >> 8) & 0xFF] ^ t[5][(lo >> 16) & 0xFF] ^ t[4][lo >> 24] ^
                  t[3][hi & 0xFF] ^ t[2][(hi >> 8) & 0xFF] ^ t[1][(hi >> 16) & 0xFF] ^ t[0][hi >> 24];
        }
        for (; len > 0; --len) {
            crc = (crc >> 8) ^ t[0][(crc ^ *p++) & 0xFF];
        }
        state_ = crc;
    }

    uint32_t CRC32C::compute(const void* data, size_t len) {
        CRC32C c;
        c.update(data, len);
        return c.finalize();
    }

} // namespace persist
} // namespace burrow
