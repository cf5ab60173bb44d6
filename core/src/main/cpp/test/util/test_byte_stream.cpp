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

#include <gtest/gtest.h>
#include "util/byte_stream.h"
#include "util/endian.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace burrow::util;

class EndianTest : public ::testing::Test {
protected:
    uint8_t buffer[16];

    void SetUp() override {
        std::memset(buffer, 0, sizeof(buffer));
    }
};

TEST_F(EndianTest, StoresLeastSignificantByteFirst) {
    store_le16(buffer, 0x1234);
    EXPECT_EQ(buffer[0], 0x34);
    EXPECT_EQ(buffer[1], 0x12);

    store_le32(buffer, 0x12345678);
    EXPECT_EQ(buffer[0], 0x78);
    EXPECT_EQ(buffer[3], 0x12);

    store_le64(buffer, 0x0102030405060708ULL);
    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(buffer[i], 8 - i);
    }
}

TEST_F(EndianTest, LoadsFromUnalignedOffsets) {
    uint8_t raw[] = {0xFF, 0x78, 0x56, 0x34, 0x12, 0xEF, 0xCD, 0xAB, 0x90};
    EXPECT_EQ(load_le16(raw + 1), 0x5678);
    EXPECT_EQ(load_le32(raw + 1), 0x12345678u);
    EXPECT_EQ(load_le64(raw + 1), 0x90ABCDEF12345678ULL);
}

TEST_F(EndianTest, DoublesKeepTheirBits) {
    store_lef64(buffer + 3, -0.0);
    EXPECT_TRUE(std::signbit(load_lef64(buffer + 3)));

    store_lef64(buffer, 1.0);
    // IEEE 754 1.0 is 0x3FF0000000000000
    EXPECT_EQ(buffer[7], 0x3F);
    EXPECT_EQ(buffer[6], 0xF0);
    EXPECT_EQ(load_lef64(buffer), 1.0);
}

TEST(ByteStreamTest, ReadsBackFieldsInOrder) {
    ByteWriter w(4);
    w.u8(0xAB);
    w.u16(0xBEEF);
    w.u32(0xDEADBEEF);
    w.u64(std::numeric_limits<uint64_t>::max());
    w.i64(-5);
    w.f64(3.25);
    w.str("jcr:content");
    w.bytes(std::vector<uint8_t>{9, 8, 7});
    w.str("");
    EXPECT_EQ(w.size(), 1u + 2 + 4 + 8 + 8 + 8 + (4 + 11) + (4 + 3) + 4);

    std::vector<uint8_t> buf = w.release();
    ByteReader r(buf);
    EXPECT_EQ(r.u8(), 0xAB);
    EXPECT_EQ(r.u16(), 0xBEEF);
    EXPECT_EQ(r.u32(), 0xDEADBEEFu);
    EXPECT_EQ(r.u64(), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(r.i64(), -5);
    EXPECT_EQ(r.f64(), 3.25);
    EXPECT_EQ(r.str(), "jcr:content");
    EXPECT_EQ(r.bytes(), (std::vector<uint8_t>{9, 8, 7}));
    EXPECT_EQ(r.str(), "");
    EXPECT_TRUE(r.at_end());
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(ByteStreamTest, LengthPrefixIsLittleEndian) {
    ByteWriter w;
    w.str("ab");
    const std::vector<uint8_t>& b = w.buffer();
    ASSERT_EQ(b.size(), 6u);
    EXPECT_EQ(b[0], 2);
    EXPECT_EQ(b[1], 0);
    EXPECT_EQ(b[4], 'a');
}

TEST(ByteStreamTest, OverrunThrows) {
    std::vector<uint8_t> three = {1, 2, 3};
    ByteReader r(three);
    EXPECT_THROW(r.u32(), std::out_of_range);
    // a failed read does not move the position
    EXPECT_EQ(r.position(), 0u);
    EXPECT_EQ(r.u16(), 0x0201);
    EXPECT_THROW(r.u16(), std::out_of_range);
    EXPECT_EQ(r.u8(), 3);
    EXPECT_THROW(r.u8(), std::out_of_range);
}

TEST(ByteStreamTest, HugeLengthPrefixThrows) {
    ByteWriter w;
    w.u32(0xFFFFFFF0u);
    w.u8('x');
    std::vector<uint8_t> buf = w.release();

    ByteReader strs(buf);
    EXPECT_THROW(strs.str(), std::out_of_range);
    ByteReader blobs(buf);
    EXPECT_THROW(blobs.bytes(), std::out_of_range);
}

TEST(ByteStreamTest, RawCopies) {
    ByteWriter w;
    const char magic[4] = {'B', 'R', 'W', '1'};
    w.raw(magic, sizeof(magic));
    w.u32(7);
    std::vector<uint8_t> buf = w.release();

    ByteReader r(buf.data(), buf.size());
    char back[4];
    r.raw(back, sizeof(back));
    EXPECT_EQ(std::memcmp(back, magic, 4), 0);
    EXPECT_EQ(r.raw(4), (std::vector<uint8_t>{7, 0, 0, 0}));
    EXPECT_EQ(r.raw(0).size(), 0u);
}
