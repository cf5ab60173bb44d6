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
#include <cerrno>
#include <memory>
#include "persistence/bundle_fs_persistence_manager.h"
#include "persistence/memory_fs.h"
#include "persistence/platform_fs.h"
#include "persistence/config.h"
#include "test_helpers.h"

using namespace burrow;
using namespace burrow::persist;

namespace {
    // Memory filesystem whose bundle record writes fail while armed
    class FailingBundleWrites final : public ItemFileSystem {
    public:
        explicit FailingBundleWrites(MemoryFileSystem& inner) : inner_(inner) {}

        bool armed = false;

        void init() override { inner_.init(); }
        void close() override { inner_.close(); }
        bool exists(const std::string& path) const override { return inner_.exists(path); }
        bool is_folder(const std::string& path) const override { return inner_.is_folder(path); }
        void create_folder(const std::string& path) override { inner_.create_folder(path); }
        std::vector<uint8_t> read(const std::string& path) const override { return inner_.read(path); }
        void write(const std::string& path, const void* data, size_t len) override {
            if (armed && path.size() > 2 && path.compare(path.size() - 2, 2, ".n") == 0) {
                throw FileSystemError("no space left writing " + path, ENOSPC);
            }
            inner_.write(path, data, len);
        }
        using ItemFileSystem::write;
        void remove(const std::string& path) override { inner_.remove(path); }
        size_t size(const std::string& path) const override { return inner_.size(path); }
        std::vector<std::string> list(const std::string& folder) const override { return inner_.list(folder); }

    private:
        MemoryFileSystem& inner_;
    };
}

class BundlePersistenceManagerTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::unique_ptr<BundleFsPersistenceManager> pm;

    void SetUp() override {
        test_dir = test::create_temp_dir("burrow_bundle_pm_test");
    }

    void TearDown() override {
        pm.reset();
        test::remove_temp_dir(test_dir);
    }

    void open(int32_t blob_block_size = 0, int32_t min_blob = bundle::kDefaultMinBlobSize) {
        BundleStoreConfig cfg = BundleStoreConfig::defaults(test_dir);
        cfg.min_blob_size = min_blob;
        cfg.blob_fs_block_size = blob_block_size;
        cfg.sync_writes = false;
        pm = std::make_unique<BundleFsPersistenceManager>(cfg);
        pm->init();
    }

    void reopen(int32_t blob_block_size = 0) {
        pm->close();
        open(blob_block_size);
    }

    std::string blob_file(const std::string& blob_id) const {
        return test_dir + "/" + files::kBlobsFolder + "/" + blob_id;
    }
};

TEST_F(BundlePersistenceManagerTest, StoreLoadExists) {
    open();
    NodePropBundle b = test::make_bundle();
    EXPECT_FALSE(pm->exists(b.id()));
    EXPECT_EQ(pm->load(b.id()), nullptr);

    pm->store(b);
    EXPECT_TRUE(pm->exists(b.id()));
    EXPECT_GT(b.size(), 0u);

    std::unique_ptr<NodePropBundle> back = pm->load(b.id());
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(*back, b);
    EXPECT_TRUE(PlatformFS::exists(test_dir + "/" + files::kItemsFolder + "/" +
                                   BundleFsPersistenceManager::bundle_path(b.id())));

    reopen();
    back = pm->load(b.id());
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(*back, b);
}

TEST_F(BundlePersistenceManagerTest, LargeBinaryAndInlineString) {
    open();
    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:resource");
    auto big = test::generate_test_data(10 * 1024 * 1024, 11);
    b.add_property(test::make_property(id, "jcr:data", {InternalValue::of_binary(big)}));
    b.add_property(test::make_property(id, "jcr:mimeType", {InternalValue::of_string("application/octet-stream")}));
    pm->store(b);

    ASSERT_EQ(b.blob_ids().size(), 1u);
    EXPECT_TRUE(PlatformFS::exists(blob_file(b.blob_ids()[0])));
    EXPECT_FALSE(b.get_property("jcr:mimeType")->is_blob(0));

    reopen();
    std::unique_ptr<NodePropBundle> back = pm->load(id);
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->get_property("jcr:data")->values[0].get_binary(), big);
    EXPECT_EQ(back->get_property("jcr:mimeType")->values[0].get_string(), "application/octet-stream");
    // bundle record itself stays small
    EXPECT_LT(back->size(), 1024u);
}

TEST_F(BundlePersistenceManagerTest, ThresholdChangeMovesValueInline) {
    open();
    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:unstructured");
    b.add_property(test::make_property(id, "text", {InternalValue::of_string(std::string(5000, 'q'))}));
    pm->store(b);
    ASSERT_EQ(b.blob_ids().size(), 1u);
    std::string old_blob = blob_file(b.blob_ids()[0]);
    EXPECT_TRUE(PlatformFS::exists(old_blob));

    pm->set_min_blob_size(8192);
    EXPECT_EQ(pm->min_blob_size(), 8192u);

    // old bundles still load with their blob
    std::unique_ptr<NodePropBundle> back = pm->load(id);
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->get_property("text")->values[0].get_string().size(), 5000u);

    // rewriting inlines the value and drops the orphaned blob
    pm->store(*back);
    EXPECT_TRUE(back->blob_ids().empty());
    EXPECT_FALSE(PlatformFS::exists(old_blob));
    EXPECT_EQ(pm->load(id)->get_property("text")->values[0].get_string(), std::string(5000, 'q'));
}

TEST_F(BundlePersistenceManagerTest, DestroyRemovesBlobs) {
    open();
    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:file");
    b.add_property(test::make_property(id, "data", {InternalValue::of_binary(test::generate_test_data(5000))}));
    pm->store(b);
    std::string blob = blob_file(b.blob_ids()[0]);

    pm->destroy(b);
    EXPECT_FALSE(pm->exists(id));
    EXPECT_FALSE(PlatformFS::exists(blob));
    EXPECT_THROW(pm->destroy(id), NoSuchItemStateError);
}

TEST_F(BundlePersistenceManagerTest, BlockBlobStoreBackend) {
    open(512);
    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:file");
    auto data = test::generate_test_data(9000, 4);
    b.add_property(test::make_property(id, "data", {InternalValue::of_binary(data)}));
    pm->store(b);

    EXPECT_TRUE(PlatformFS::exists(test_dir + "/" + files::kBlobsFolder + "/" + block_store::kContainerFile));
    reopen(512);
    EXPECT_EQ(pm->load(id)->get_property("data")->values[0].get_binary(), data);
}

TEST_F(BundlePersistenceManagerTest, ItemStoreBlobBackend) {
    open(-1);
    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:file");
    b.add_property(test::make_property(id, "data", {InternalValue::of_binary(test::generate_test_data(5000))}));
    pm->store(b);

    EXPECT_TRUE(PlatformFS::exists(test_dir + "/" + files::kItemsFolder + "/" + b.blob_ids()[0]));
    EXPECT_FALSE(PlatformFS::exists(test_dir + "/" + files::kBlobsFolder));
}

TEST_F(BundlePersistenceManagerTest, Lifecycle) {
    BundleStoreConfig cfg = BundleStoreConfig::defaults(test_dir);
    cfg.sync_writes = false;
    pm = std::make_unique<BundleFsPersistenceManager>(cfg);

    NodeId id = NodeId::random();
    EXPECT_FALSE(pm->is_initialized());
    EXPECT_THROW(pm->load(id), InvalidItemStateError);
    EXPECT_THROW(pm->exists_references(id), InvalidItemStateError);
    EXPECT_THROW(pm->close(), InvalidItemStateError);

    pm->init();
    EXPECT_TRUE(pm->is_initialized());
    EXPECT_THROW(pm->init(), InvalidItemStateError);

    pm->close();
    EXPECT_THROW(pm->close(), InvalidItemStateError);
    EXPECT_THROW(pm->exists(id), InvalidItemStateError);

    // can be initialized again after close
    pm->init();
    EXPECT_FALSE(pm->exists(id));
}

TEST_F(BundlePersistenceManagerTest, InvalidConfiguration) {
    BundleStoreConfig cfg;
    EXPECT_THROW(BundleFsPersistenceManager bad(cfg), std::invalid_argument);

    cfg = BundleStoreConfig::defaults(test_dir);
    cfg.blob_fs_block_size = 1000;
    BundleFsPersistenceManager odd(cfg);
    EXPECT_THROW(odd.init(), std::invalid_argument);
    EXPECT_FALSE(odd.is_initialized());
}

TEST_F(BundlePersistenceManagerTest, References) {
    open();
    NodeId target = NodeId::random();
    EXPECT_FALSE(pm->exists_references(target));
    EXPECT_THROW(pm->load_references(target), NoSuchItemStateError);
    EXPECT_THROW(pm->destroy_references(target), NoSuchItemStateError);

    NodeReferences refs(target);
    refs.add_reference(PropertyId(NodeId::random(), "ref"));
    pm->store_references(refs);
    EXPECT_TRUE(pm->exists_references(target));
    EXPECT_EQ(pm->load_references(target), refs);

    pm->destroy_references(target);
    EXPECT_FALSE(pm->exists_references(target));
}

TEST_F(BundlePersistenceManagerTest, ChangeSetAppliesEverything) {
    open();
    NodePropBundle gone = test::make_bundle();
    pm->store(gone);
    NodeReferences old_refs(gone.id());
    old_refs.add_reference(PropertyId(NodeId::random(), "p"));
    pm->store_references(old_refs);

    ChangeSet cs;
    cs.deleted.push_back(gone.id());
    cs.deleted_refs.push_back(gone.id());
    cs.modified.push_back(test::make_bundle());
    cs.modified.push_back(test::make_bundle());
    NodeReferences new_refs(cs.modified[0].id());
    new_refs.add_reference(PropertyId(cs.modified[1].id(), "link"));
    cs.modified_refs.push_back(new_refs);
    EXPECT_FALSE(cs.empty());

    pm->store(cs);
    EXPECT_FALSE(pm->exists(gone.id()));
    EXPECT_FALSE(pm->exists_references(gone.id()));
    EXPECT_EQ(*pm->load(cs.modified[0].id()), cs.modified[0]);
    EXPECT_EQ(*pm->load(cs.modified[1].id()), cs.modified[1]);
    EXPECT_EQ(pm->load_references(cs.modified[0].id()), new_refs);
}

TEST_F(BundlePersistenceManagerTest, CorruptBundleFailsToLoad) {
    open();
    NodePropBundle b = test::make_bundle();
    pm->store(b);
    pm->close();

    test::corrupt_file(test_dir + "/" + files::kItemsFolder + "/" +
                       BundleFsPersistenceManager::bundle_path(b.id()), 30, 4);
    open();
    EXPECT_THROW(pm->load(b.id()), ItemStateError);
}

TEST(MemoryBundlePersistenceManagerTest, WorksWithoutDisk) {
    BundleStoreConfig cfg;
    cfg.blob_fs_block_size = -1;
    cfg.min_blob_size = 16;
    BundleFsPersistenceManager pm(cfg, std::make_unique<MemoryFileSystem>());
    pm.init();

    NodePropBundle b = test::make_bundle();
    b.add_property(test::make_property(b.id(), "long", {InternalValue::of_string(std::string(100, 'z'))}));
    pm.store(b);
    EXPECT_EQ(*pm.load(b.id()), b);
    EXPECT_EQ(b.blob_ids().size(), 1u);
    pm.close();
}

TEST(MemoryBundlePersistenceManagerTest, FailedStoreKeepsStoredBundle) {
    MemoryFileSystem memory;
    BundleStoreConfig cfg;
    cfg.blob_fs_block_size = -1;
    cfg.min_blob_size = 16;
    auto failing = std::make_unique<FailingBundleWrites>(memory);
    FailingBundleWrites& fs = *failing;
    BundleFsPersistenceManager pm(cfg, std::move(failing));
    pm.init();

    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:unstructured");
    b.add_property(test::make_property(id, "text", {InternalValue::of_string(std::string(100, 'A'))}));
    pm.store(b);
    ASSERT_EQ(b.blob_ids().size(), 1u);
    const std::string a_blob = b.blob_ids()[0];
    const size_t files = memory.file_count();

    NodePropBundle next(b);
    next.set_mod_count(1);
    next.add_property(test::make_property(id, "text", {InternalValue::of_string(std::string(100, 'B'))}));
    fs.armed = true;
    EXPECT_THROW(pm.store(next), ItemStateError);

    // the stored bundle and its blob are untouched, the new blob is gone
    std::unique_ptr<NodePropBundle> back = pm.load(id);
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->get_property("text")->values[0].get_string(), std::string(100, 'A'));
    EXPECT_EQ(back->mod_count(), 0);
    EXPECT_EQ(memory.file_count(), files);

    fs.armed = false;
    pm.store(next);
    EXPECT_NE(next.blob_ids()[0], a_blob);
    EXPECT_EQ(pm.load(id)->get_property("text")->values[0].get_string(), std::string(100, 'B'));
    EXPECT_FALSE(memory.exists(std::string(files::kItemsFolder) + "/" + a_blob));
    EXPECT_EQ(memory.file_count(), files);
    pm.close();
}

TEST(MemoryBundlePersistenceManagerTest, RewriteWithSameModCountKeepsOldBlobUntilReplaced) {
    BundleStoreConfig cfg;
    cfg.blob_fs_block_size = -1;
    cfg.min_blob_size = 16;
    BundleFsPersistenceManager pm(cfg, std::make_unique<MemoryFileSystem>());
    pm.init();

    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:unstructured");
    b.add_property(test::make_property(id, "text", {InternalValue::of_string(std::string(100, 'A'))}));
    pm.store(b);

    NodePropBundle same_gen(b);
    same_gen.add_property(test::make_property(id, "text", {InternalValue::of_string(std::string(100, 'C'))}));
    pm.store(same_gen);
    EXPECT_NE(same_gen.blob_ids()[0], b.blob_ids()[0]);
    EXPECT_EQ(pm.load(id)->get_property("text")->values[0].get_string(), std::string(100, 'C'));
    pm.close();
}

TEST_F(BundlePersistenceManagerTest, UnchangedBlobIsNotRewritten) {
    open();
    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:file");
    b.add_property(test::make_property(id, "data", {InternalValue::of_binary(test::generate_test_data(5000, 2))}));
    b.add_property(test::make_property(id, "title", {InternalValue::of_string("v1")}));
    pm->store(b);
    const std::string blob = b.blob_ids()[0];

    std::unique_ptr<NodePropBundle> next = pm->load(id);
    next->set_mod_count(1);
    next->add_property(test::make_property(id, "title", {InternalValue::of_string("v2")}));
    pm->store(*next);
    EXPECT_EQ(next->blob_ids()[0], blob);
    EXPECT_TRUE(PlatformFS::exists(blob_file(blob)));

    // a changed value gets a new blob and the old one is dropped
    next->set_mod_count(2);
    next->add_property(test::make_property(id, "data", {InternalValue::of_binary(test::generate_test_data(5000, 3))}));
    pm->store(*next);
    EXPECT_NE(next->blob_ids()[0], blob);
    EXPECT_FALSE(PlatformFS::exists(blob_file(blob)));
    EXPECT_EQ(pm->load(id)->get_property("data")->values[0].get_binary(), test::generate_test_data(5000, 3));
}

TEST_F(BundlePersistenceManagerTest, BlockStoreDoesNotGrowForUnchangedBlobs) {
    open(512);
    NodeId id = NodeId::random();
    NodePropBundle b(id);
    b.set_node_type("nt:file");
    b.add_property(test::make_property(id, "data", {InternalValue::of_binary(test::generate_test_data(100000, 5))}));
    pm->store(b);

    const std::string container = test_dir + "/" + files::kBlobsFolder + "/" + block_store::kContainerFile;
    const size_t before = PlatformFS::file_size(container).second;
    for (uint16_t i = 1; i <= 5; ++i) {
        b.set_mod_count(i);
        b.add_property(test::make_property(id, "title", {InternalValue::of_string("edit " + std::to_string(i))}));
        pm->store(b);
    }
    EXPECT_EQ(PlatformFS::file_size(container).second, before);
    EXPECT_EQ(pm->load(id)->get_property("data")->values[0].get_binary(), test::generate_test_data(100000, 5));
}
