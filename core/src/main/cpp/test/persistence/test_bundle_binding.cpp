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
#include <stdexcept>
#include "persistence/bundle_binding.h"
#include "persistence/memory_fs.h"
#include "persistence/config.h"
#include "test_helpers.h"

using namespace burrow;
using namespace burrow::persist;

class BundleBindingTest : public ::testing::Test {
protected:
    MemoryFileSystem fs;
    std::unique_ptr<NameIndex> names;
    std::unique_ptr<FileSystemBlobStore> blobs;
    std::unique_ptr<BundleBinding> binding;

    void SetUp() override {
        fs.init();
        names = std::make_unique<NameIndex>(fs, files::kNameIndexFile);
        names->load();
        blobs = std::make_unique<FileSystemBlobStore>(fs);
        binding = std::make_unique<BundleBinding>(*names, *blobs, 64);
    }
};

TEST_F(BundleBindingTest, BundleRoundTripPreservesEverything) {
    NodePropBundle b = test::make_bundle();
    b.add_property(test::make_property(b.id(), "when", {InternalValue::of_date(1700000000123LL)}));
    b.add_property(test::make_property(b.id(), "ratio", {InternalValue::of_double(0.25)}));
    b.add_property(test::make_property(b.id(), "flag", {InternalValue::of_boolean(true)}));
    b.add_property(test::make_property(b.id(), "path", {InternalValue::of_path("/a/b[2]")}));
    b.add_property(test::make_property(b.id(), "ref", {InternalValue::of_reference(NodeId::random())}));
    b.add_property(test::make_property(b.id(), "empty", {}, true));

    std::vector<uint8_t> data = binding->write_bundle(b);
    NodePropBundle back = binding->read_bundle(data);

    EXPECT_EQ(back, b);
    EXPECT_EQ(back.size(), data.size());
    EXPECT_TRUE(back.get_property("tags")->multi_valued);
    EXPECT_EQ(back.child_entries()[1].index, 2u);
    EXPECT_TRUE(back.blob_ids().empty());
}

TEST_F(BundleBindingTest, LargeValuesGoToBlobStore) {
    NodePropBundle b(NodeId::random());
    b.set_node_type("nt:file");
    auto big = test::generate_test_data(64, 3);
    auto small = test::generate_test_data(63, 3);
    b.add_property(test::make_property(b.id(), "data", {InternalValue::of_binary(big), InternalValue::of_binary(small)}, true));

    std::vector<uint8_t> data = binding->write_bundle(b);

    // value at the threshold is offloaded, one below stays inline
    const PropertyEntry* p = b.get_property("data");
    ASSERT_NE(p, nullptr);
    EXPECT_TRUE(p->is_blob(0));
    EXPECT_FALSE(p->is_blob(1));
    EXPECT_EQ(p->blob_ids[0], binding->blob_id(p->id, 0, b.mod_count()));
    EXPECT_TRUE(blobs->exists(p->blob_ids[0]));
    EXPECT_EQ(b.blob_ids().size(), 1u);

    NodePropBundle back = binding->read_bundle(data);
    EXPECT_EQ(back.get_property("data")->values[0].get_binary(), big);
    EXPECT_EQ(back.get_property("data")->values[1].get_binary(), small);
    EXPECT_EQ(back.blob_ids(), b.blob_ids());

    // lazy read leaves the offloaded value empty but keeps its id
    NodePropBundle shallow = binding->read_bundle(data, false);
    EXPECT_TRUE(shallow.get_property("data")->is_blob(0));
    EXPECT_EQ(shallow.get_property("data")->values.size(), 2u);
}

TEST_F(BundleBindingTest, MissingBlobPropagates) {
    NodePropBundle b(NodeId::random());
    b.set_node_type("nt:file");
    b.add_property(test::make_property(b.id(), "data", {InternalValue::of_string(std::string(200, 'x'))}));
    std::vector<uint8_t> data = binding->write_bundle(b);

    blobs->remove(b.get_property("data")->blob_ids[0]);
    EXPECT_THROW(binding->read_bundle(data), NoSuchItemStateError);
}

TEST_F(BundleBindingTest, CorruptRecordsAreRejected) {
    NodePropBundle b = test::make_bundle();
    std::vector<uint8_t> data = binding->write_bundle(b);

    std::vector<uint8_t> flipped = data;
    flipped[20] ^= 0x01;
    EXPECT_THROW(binding->read_bundle(flipped), ItemStateError);

    std::vector<uint8_t> truncated(data.begin(), data.begin() + 3);
    EXPECT_THROW(binding->read_bundle(truncated), ItemStateError);

    EXPECT_THROW(binding->read_references(data), ItemStateError);
}

TEST_F(BundleBindingTest, ReferencesRoundTrip) {
    NodeId target = NodeId::random();
    NodeReferences refs(target);
    NodeId a = NodeId::random();
    refs.add_reference(PropertyId(a, "link"));
    refs.add_reference(PropertyId(NodeId::random(), "other"));
    refs.add_reference(PropertyId(a, "link"));

    NodeReferences back = binding->read_references(binding->write_references(refs));
    EXPECT_EQ(back, refs);
    EXPECT_EQ(back.target_id(), target);

    EXPECT_TRUE(back.remove_reference(PropertyId(a, "link")));
    EXPECT_EQ(back.references().size(), 2u);
    EXPECT_FALSE(back.remove_reference(PropertyId(NodeId::random(), "link")));
}

TEST_F(BundleBindingTest, NodePathsFanOut) {
    NodeId id = NodeId::from_string("0a1b2c3d-0000-4000-8000-000000000001");
    EXPECT_EQ(BundleBinding::node_base_path(id), "0a/1b/2c/0a1b2c3d-0000-4000-8000-000000000001");
    EXPECT_EQ(BundleBinding::node_folder_path(id), "0a/1b/2c");
}

TEST(InternalValueTest, TypedAccessors) {
    EXPECT_EQ(InternalValue::of_long(-5).get_long(), -5);
    EXPECT_EQ(InternalValue::of_date(99).get_date(), 99);
    EXPECT_TRUE(InternalValue::of_boolean(true).get_boolean());
    EXPECT_EQ(InternalValue::of_name("jcr:content").get_string(), "jcr:content");
    EXPECT_THROW(InternalValue::of_long(1).get_string(), std::logic_error);
    EXPECT_THROW(InternalValue::of_string("x").get_reference(), std::logic_error);

    // same payload, different type
    EXPECT_NE(InternalValue::of_long(7), InternalValue::of_date(7));
    EXPECT_NE(InternalValue::of_string("a"), InternalValue::of_name("a"));
}

TEST(InternalValueTest, BytesRoundTripPerType) {
    std::vector<InternalValue> values = {
        InternalValue::of_string("text"), InternalValue::of_binary({1, 2, 3}),
        InternalValue::of_long(1LL << 40), InternalValue::of_double(-1.5),
        InternalValue::of_date(0), InternalValue::of_boolean(false),
        InternalValue::of_path("/x"), InternalValue::of_reference(NodeId::random())};
    for (const auto& v : values) {
        std::vector<uint8_t> b = v.to_bytes();
        EXPECT_EQ(b.size(), v.serialized_size()) << property_type_name(v.type());
        EXPECT_EQ(InternalValue::from_bytes(v.type(), b.data(), b.size()), v);
    }

    uint8_t three[3] = {0, 0, 0};
    EXPECT_THROW(InternalValue::from_bytes(PropertyType::LONG, three, 3), std::invalid_argument);
    EXPECT_THROW(property_type_from_tag(0), std::invalid_argument);
    EXPECT_THROW(property_type_from_tag(10), std::invalid_argument);
}

TEST_F(BundleBindingTest, NewBlobsNeverReuseStoredIds) {
    NodePropBundle b(NodeId::random());
    b.set_node_type("nt:file");
    b.add_property(test::make_property(b.id(), "data", {InternalValue::of_string(std::string(200, 'x'))}));
    binding->write_bundle(b);
    NodePropBundle stored = binding->read_bundle(binding->write_bundle(b), false);
    const std::string first = stored.get_property("data")->blob_ids[0];

    // same mod count, different bytes: the stored blob must survive
    NodePropBundle changed(b);
    changed.add_property(test::make_property(b.id(), "data", {InternalValue::of_string(std::string(200, 'y'))}));
    std::vector<std::string> written;
    binding->write_bundle(changed, &stored, &written);
    const std::string second = changed.get_property("data")->blob_ids[0];
    EXPECT_NE(second, first);
    EXPECT_EQ(second, binding->blob_id(changed.get_property("data")->id, 0, changed.mod_count() + 1));
    EXPECT_EQ(written, std::vector<std::string>{second});
    EXPECT_EQ(blobs->get(first), InternalValue::of_string(std::string(200, 'x')).to_bytes());

    // same bytes: the stored blob is kept and nothing is written
    NodePropBundle same(b);
    same.set_mod_count(7);
    written.clear();
    binding->write_bundle(same, &stored, &written);
    EXPECT_EQ(same.get_property("data")->blob_ids[0], first);
    EXPECT_TRUE(written.empty());
}
