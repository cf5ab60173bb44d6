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
#include <memory>
#include "state/workspace.h"
#include "persistence/bundle_fs_persistence_manager.h"
#include "persistence/memory_fs.h"
#include "errors.h"
#include "persistence/test_helpers.h"

using namespace burrow;
using namespace burrow::state;
using namespace burrow::persist;
using ::testing::_;
using ::testing::Invoke;

namespace {
    class MockCommitter : public ChangeSetCommitter {
    public:
        MOCK_METHOD(void, commit, (const std::function<void(ChangeSet&)>&), (override));
    };
}

class WorkspaceTest : public ::testing::Test {
protected:
    std::unique_ptr<BundleFsPersistenceManager> pm;
    std::unique_ptr<Workspace> ws;
    NodeId root_id = NodeId::from_string("cafebabe-cafe-babe-cafe-babecafebabe");

    void SetUp() override {
        BundleStoreConfig cfg;
        cfg.sync_writes = false;
        pm = std::make_unique<BundleFsPersistenceManager>(cfg, std::make_unique<MemoryFileSystem>());
        pm->init();
        ws = std::make_unique<Workspace>(*pm);
        ws->ensure_root(root_id, "rep:root");
    }

    void TearDown() override {
        ws.reset();
        pm->close();
    }

    // Adds a child with one string property and saves it
    NodeId add_saved_node(Workspace& w, const std::string& name, const std::string& text) {
        ChangeLog log{ItemId(root_id)};
        NodeState& n = w.add_node(log, root_id, name, "nt:unstructured");
        w.add_property(log, n.id(), "text", PropertyType::STRING, {InternalValue::of_string(text)});
        w.save(log);
        return n.id();
    }
};

TEST_F(WorkspaceTest, EnsureRootCreatesOnce) {
    EXPECT_TRUE(pm->exists(root_id));
    NodeState& root = ws->get_node(root_id);
    EXPECT_EQ(root.node_type(), "rep:root");
    EXPECT_TRUE(root.parent_id().is_nil());

    Workspace other(*pm);
    EXPECT_EQ(other.ensure_root(root_id, "ignored").node_type(), "rep:root");
}

TEST_F(WorkspaceTest, SavePersistsNewItems) {
    NodeId id = add_saved_node(*ws, "doc", "hello");

    std::unique_ptr<NodePropBundle> b = pm->load(id);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->parent_id(), root_id);
    EXPECT_EQ(b->mod_count(), 0);
    EXPECT_EQ(b->get_property("text")->values[0].get_string(), "hello");

    std::unique_ptr<NodePropBundle> root = pm->load(root_id);
    ASSERT_EQ(root->child_entries().size(), 1u);
    EXPECT_EQ(root->child_entries()[0].name, "doc");
    EXPECT_EQ(root->mod_count(), 1);

    EXPECT_EQ(ws->get_node(id).get_status(), Status::EXISTING);
    EXPECT_EQ(ws->get_node(root_id).mod_count(), 1);

    // a fresh session sees the same content
    Workspace other(*pm);
    EXPECT_EQ(other.get_property(PropertyId(id, "text")).value().get_string(), "hello");
    EXPECT_TRUE(other.has_node(id));
    EXPECT_FALSE(other.has_node(NodeId::random()));
}

TEST_F(WorkspaceTest, ModCountAdvancesPerSave) {
    NodeId id = add_saved_node(*ws, "doc", "v0");
    for (int i = 1; i <= 3; ++i) {
        ChangeLog log{ItemId(id)};
        ws->set_value(log, PropertyId(id, "text"), PropertyType::STRING,
                      {InternalValue::of_string("v" + std::to_string(i))});
        ws->save(log);
        EXPECT_EQ(pm->load(id)->mod_count(), i);
        EXPECT_EQ(pm->load(id)->get_property("text")->mod_count, i);
    }
}

TEST_F(WorkspaceTest, EmptyLogIsNoop) {
    ChangeLog log;
    ws->save(log);
    EXPECT_FALSE(log.is_consumed());
}

TEST_F(WorkspaceTest, MissingItems) {
    EXPECT_THROW(ws->get_node(NodeId::random()), NoSuchItemStateError);
    EXPECT_THROW(ws->get_property(PropertyId(root_id, "nope")), NoSuchItemStateError);

    ChangeLog log;
    EXPECT_THROW(ws->add_node(log, NodeId::random(), "x", "nt:base"), NoSuchItemStateError);
    EXPECT_THROW(ws->add_node(log, root_id, "x", "nt:base", root_id), InvalidItemStateError);
}

TEST_F(WorkspaceTest, ConcurrentModificationIsStale) {
    NodeId id = add_saved_node(*ws, "doc", "base");
    Workspace other(*pm);
    other.get_property(PropertyId(id, "text"));

    {
        ChangeLog log;
        ws->set_value(log, PropertyId(id, "text"), PropertyType::STRING, {InternalValue::of_string("mine")});
        ws->save(log);
    }

    ChangeLog log;
    other.set_value(log, PropertyId(id, "text"), PropertyType::STRING, {InternalValue::of_string("theirs")});
    try {
        other.save(log);
        FAIL() << "expected StaleItemStateError";
    } catch (const StaleItemStateError& e) {
        EXPECT_TRUE(e.is_retryable());
    }
    EXPECT_TRUE(log.is_consumed());
    EXPECT_EQ(pm->load(id)->get_property("text")->values[0].get_string(), "mine");

    // the stale state was reverted and reloads on access
    PropertyState& p = other.get_property(PropertyId(id, "text"));
    EXPECT_EQ(p.get_status(), Status::EXISTING);
    EXPECT_EQ(p.value().get_string(), "mine");

    ChangeLog retry;
    other.set_value(retry, PropertyId(id, "text"), PropertyType::STRING, {InternalValue::of_string("theirs")});
    other.save(retry);
    EXPECT_EQ(pm->load(id)->get_property("text")->values[0].get_string(), "theirs");
}

TEST_F(WorkspaceTest, ExternalDestroyIsStale) {
    NodeId id = add_saved_node(*ws, "doc", "base");
    Workspace other(*pm);
    other.get_node(id);

    {
        ChangeLog log;
        ws->remove(log, ItemId(id));
        ws->save(log);
    }
    EXPECT_FALSE(pm->exists(id));

    ChangeLog log;
    other.set_mixins(log, id, {"mix:title"});
    EXPECT_THROW(other.save(log), StaleItemStateError);
    EXPECT_FALSE(other.has_node(id));
}

TEST_F(WorkspaceTest, FailedCommitUndoesLog) {
    NodeId id = add_saved_node(*ws, "doc", "base");

    MockCommitter committer;
    EXPECT_CALL(committer, commit(_)).WillOnce(Invoke([](const std::function<void(ChangeSet&)>& prepare) {
        ChangeSet cs;
        prepare(cs);
        EXPECT_EQ(cs.modified.size(), 1u);
        throw ItemStateError("disk gone");
    }));
    ws->set_committer(&committer);

    ChangeLog log;
    ws->set_value(log, PropertyId(id, "text"), PropertyType::STRING, {InternalValue::of_string("lost")});
    EXPECT_THROW(ws->save(log), ItemStateError);

    PropertyState& p = ws->get_property(PropertyId(id, "text"));
    EXPECT_EQ(p.get_status(), Status::EXISTING);
    EXPECT_EQ(p.value().get_string(), "base");
    ws->set_committer(nullptr);
}

TEST_F(WorkspaceTest, CommitterReceivesChangeSet) {
    MockCommitter committer;
    EXPECT_CALL(committer, commit(_)).WillOnce(Invoke([this](const std::function<void(ChangeSet&)>& prepare) {
        ChangeSet cs;
        prepare(cs);
        pm->store(cs);
    }));
    ws->set_committer(&committer);

    NodeId id = add_saved_node(*ws, "via", "committer");
    EXPECT_TRUE(pm->exists(id));
    ws->set_committer(nullptr);
}

TEST_F(WorkspaceTest, ReferencesFollowProperties) {
    NodeId target = add_saved_node(*ws, "target", "t");
    NodeId source = add_saved_node(*ws, "source", "s");

    {
        ChangeLog log;
        ws->add_property(log, source, "link", PropertyType::REFERENCE, {InternalValue::of_reference(target)});
        ws->save(log);
    }
    ASSERT_TRUE(pm->exists_references(target));
    NodeReferences refs = pm->load_references(target);
    ASSERT_EQ(refs.references().size(), 1u);
    EXPECT_EQ(refs.references()[0], PropertyId(source, "link"));

    // retarget to another node
    NodeId other = add_saved_node(*ws, "other", "o");
    {
        ChangeLog log;
        ws->set_value(log, PropertyId(source, "link"), PropertyType::REFERENCE,
                      {InternalValue::of_reference(other)});
        ws->save(log);
    }
    EXPECT_FALSE(pm->exists_references(target));
    EXPECT_EQ(pm->load_references(other).references().size(), 1u);

    {
        ChangeLog log;
        ws->remove(log, ItemId(PropertyId(source, "link")));
        ws->save(log);
    }
    EXPECT_FALSE(pm->exists_references(other));
    EXPECT_FALSE(pm->load(source)->has_property("link"));
}

TEST_F(WorkspaceTest, RemoveSubtree) {
    NodeId parent = add_saved_node(*ws, "parent", "p");
    NodeId child;
    {
        ChangeLog log;
        child = ws->add_node(log, parent, "child", "nt:base").id();
        ws->add_property(log, child, "x", PropertyType::LONG, {InternalValue::of_long(1)});
        ws->save(log);
    }

    ChangeLog log;
    ws->remove(log, ItemId(parent));
    EXPECT_EQ(ws->get_node(root_id).child_entries().size(), 0u);
    ws->save(log);

    EXPECT_FALSE(pm->exists(parent));
    EXPECT_FALSE(pm->exists(child));
    EXPECT_TRUE(pm->load(root_id)->child_entries().empty());
    EXPECT_FALSE(ws->has_node(child));

    ChangeLog root_log;
    EXPECT_THROW(ws->remove(root_log, ItemId(root_id)), InvalidItemStateError);
}

TEST_F(WorkspaceTest, MoveNode) {
    NodeId a = add_saved_node(*ws, "a", "a");
    NodeId b = add_saved_node(*ws, "b", "b");

    ChangeLog log;
    ws->move(log, a, b, "moved");
    ws->save(log);

    EXPECT_EQ(pm->load(a)->parent_id(), b);
    ASSERT_EQ(pm->load(b)->child_entries().size(), 1u);
    EXPECT_EQ(pm->load(b)->child_entries()[0].name, "moved");
    EXPECT_EQ(pm->load(root_id)->child_entries().size(), 1u);

    ChangeLog bad;
    EXPECT_THROW(ws->move(bad, b, a, "loop"), InvalidItemStateError);
    EXPECT_THROW(ws->move(bad, root_id, a, "root"), InvalidItemStateError);
}

TEST_F(WorkspaceTest, MixinChangeReloads) {
    ChangeLog log;
    ws->set_mixins(log, root_id, {"mix:lockable"});
    ws->save(log);

    HierarchyEntry* e = ws->entries().get(ItemId(root_id));
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->state()->get_status(), Status::INVALIDATED);

    NodeState& root = ws->get_node(root_id);
    EXPECT_EQ(root.get_status(), Status::EXISTING);
    EXPECT_EQ(root.mixins(), std::set<std::string>{"mix:lockable"});
}

TEST_F(WorkspaceTest, ExternalUpdate) {
    NodeId id = add_saved_node(*ws, "doc", "base");
    NodeId pending = add_saved_node(*ws, "pending", "base");

    ChangeLog log;
    ws->set_value(log, PropertyId(pending, "text"), PropertyType::STRING, {InternalValue::of_string("local")});

    ChangeSet external;
    external.modified.push_back(*pm->load(id));
    external.modified.push_back(*pm->load(pending));
    ws->external_update(external);

    EXPECT_EQ(ws->entries().get(ItemId(id))->state()->get_status(), Status::INVALIDATED);
    EXPECT_EQ(ws->entries().get(ItemId(PropertyId(pending, "text")))->state()->get_status(),
              Status::STALE_MODIFIED);

    // pending work on a stale item cannot be saved
    EXPECT_THROW(ws->save(log), StaleItemStateError);

    ChangeSet destroyed;
    destroyed.deleted.push_back(id);
    ws->external_update(destroyed);
    EXPECT_EQ(ws->entries().get(ItemId(id))->state()->get_status(), Status::REMOVED);
}

TEST_F(WorkspaceTest, RefreshInvalidatesUnmodified) {
    NodeId id = add_saved_node(*ws, "doc", "base");
    ws->refresh();
    EXPECT_EQ(ws->entries().get(ItemId(id))->state()->get_status(), Status::INVALIDATED);
    EXPECT_EQ(ws->get_node(id).get_status(), Status::EXISTING);
}
