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
#include <gmock/gmock.h>
#include "persistence/name_index.h"
#include "persistence/memory_fs.h"
#include "test_helpers.h"

using namespace burrow;
using namespace burrow::persist;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {
    class MockItemFileSystem : public ItemFileSystem {
    public:
        MOCK_METHOD(void, init, (), (override));
        MOCK_METHOD(void, close, (), (override));
        MOCK_METHOD(bool, exists, (const std::string&), (const, override));
        MOCK_METHOD(bool, is_folder, (const std::string&), (const, override));
        MOCK_METHOD(void, create_folder, (const std::string&), (override));
        MOCK_METHOD(std::vector<uint8_t>, read, (const std::string&), (const, override));
        MOCK_METHOD(void, write, (const std::string&, const void*, size_t), (override));
        MOCK_METHOD(void, remove, (const std::string&), (override));
        MOCK_METHOD(size_t, size, (const std::string&), (const, override));
        MOCK_METHOD(std::vector<std::string>, list, (const std::string&), (const, override));
    };
}

class NameIndexTest : public ::testing::Test {
protected:
    MemoryFileSystem fs;

    void SetUp() override {
        fs.init();
    }
};

TEST_F(NameIndexTest, AssignsDenseIndices) {
    NameIndex idx(fs, "meta/names.idx");
    idx.load();
    EXPECT_EQ(idx.size(), 0u);

    EXPECT_EQ(idx.index_of("jcr:primaryType"), 0u);
    EXPECT_EQ(idx.index_of("jcr:mixinTypes"), 1u);
    EXPECT_EQ(idx.index_of("jcr:primaryType"), 0u);
    EXPECT_EQ(idx.size(), 2u);
    EXPECT_EQ(idx.name_of(1), "jcr:mixinTypes");
    EXPECT_TRUE(idx.contains("jcr:mixinTypes"));
    EXPECT_FALSE(idx.contains("jcr:uuid"));
    EXPECT_THROW(idx.name_of(2), NoSuchItemStateError);
}

TEST_F(NameIndexTest, SurvivesReload) {
    {
        NameIndex idx(fs, "meta/names.idx");
        idx.load();
        idx.index_of("a");
        idx.index_of("b");
        idx.index_of("");
    }
    NameIndex again(fs, "meta/names.idx");
    again.load();
    EXPECT_EQ(again.size(), 3u);
    EXPECT_EQ(again.name_of(0), "a");
    EXPECT_EQ(again.name_of(1), "b");
    EXPECT_EQ(again.name_of(2), "");
    EXPECT_EQ(again.index_of("c"), 3u);
}

TEST_F(NameIndexTest, CorruptFileIsRejected) {
    {
        NameIndex idx(fs, "names.idx");
        idx.load();
        idx.index_of("something");
    }
    std::vector<uint8_t> data = fs.read("names.idx");
    data[6] ^= 0x40;
    fs.write("names.idx", data);

    NameIndex again(fs, "names.idx");
    EXPECT_THROW(again.load(), ItemStateError);

    fs.write("names.idx", std::vector<uint8_t>{1, 2});
    EXPECT_THROW(again.load(), ItemStateError);
}

TEST_F(NameIndexTest, FailedPersistDoesNotHandOutIndex) {
    MockItemFileSystem mock;
    EXPECT_CALL(mock, create_folder(_)).WillRepeatedly(Return());
    EXPECT_CALL(mock, write(_, _, _))
        .WillOnce(Throw(FileSystemError("disk full", ENOSPC)))
        .WillOnce(Return());

    NameIndex idx(mock, "names.idx");
    EXPECT_THROW(idx.index_of("first"), ItemStateError);
    EXPECT_FALSE(idx.contains("first"));
    EXPECT_EQ(idx.size(), 0u);

    EXPECT_EQ(idx.index_of("first"), 0u);
    EXPECT_TRUE(idx.contains("first"));
}
