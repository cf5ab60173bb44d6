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
#include "state/change_log.h"
#include "state/operation.h"
#include "errors.h"
#include "persistence/test_helpers.h"

using namespace burrow;
using namespace burrow::state;
using namespace burrow::persist;

class ChangeLogTest : public ::testing::Test {
protected:
    EntryTable table;
    NodePropBundle bundle;
    NodeState* root = nullptr;
    PropertyState* title = nullptr;

    void SetUp() override {
        bundle = test::make_bundle();
        root = table.add(NodeState::from_bundle(bundle)).node_state();
        title = table.add(PropertyState::from_entry(*bundle.get_property("title"))).property_state();
    }

    static StateConfig strict() {
        StateConfig cfg;
        cfg.strict_status_checks = true;
        return cfg;
    }
};

TEST_F(ChangeLogTest, PersistedMakesEverythingExisting) {
    ChangeLog log(ItemId(root->id()));
    log.add(AddNode::create(table, *root, "fresh", NodeId::random(), "nt:folder"));
    AddNode* add = static_cast<AddNode*>(log.operations().back().get());
    NodeState& child = add->child();
    log.add(AddProperty::create(table, child, "size", PropertyType::LONG, {InternalValue::of_long(3)}, false));
    log.add(SetPropertyValue::create(*title, PropertyType::STRING, {InternalValue::of_string("bye")}));

    EXPECT_EQ(root->get_status(), Status::EXISTING_MODIFIED);
    EXPECT_EQ(child.get_status(), Status::NEW);
    // root, child, size, title
    EXPECT_EQ(log.affected_states().size(), 4u);

    log.persisted();
    EXPECT_TRUE(log.is_consumed());
    for (ItemState* s : log.affected_states()) {
        EXPECT_EQ(s->get_status(), Status::EXISTING) << s->item_id().to_string();
        EXPECT_FALSE(s->entry()->has_snapshot());
    }
    EXPECT_EQ(title->value().get_string(), "bye");
    EXPECT_NE(root->child_entry("fresh"), nullptr);
}

TEST_F(ChangeLogTest, UndoRestoresLastKnownGood) {
    ChangeLog log(ItemId(root->id()));
    NodeId id = NodeId::random();
    log.add(AddNode::create(table, *root, "fresh", id, "nt:folder"));
    log.add(SetPropertyValue::create(*title, PropertyType::STRING, {InternalValue::of_string("bye")}));
    log.add(SetMixin::create(*root, {"mix:versionable"}));

    log.undo();
    EXPECT_EQ(root->get_status(), Status::EXISTING);
    EXPECT_EQ(root->child_entries().size(), 3u);
    EXPECT_EQ(root->mixins(), bundle.mixins());
    EXPECT_EQ(title->get_status(), Status::EXISTING);
    EXPECT_EQ(title->value().get_string(), "hello");
    EXPECT_EQ(table.get(ItemId(id))->state()->get_status(), Status::REMOVED);
}

TEST_F(ChangeLogTest, RemoveIsResolvedOnPersist) {
    ChangeLog log;
    log.add(Remove::create(*title, *root, {}));
    EXPECT_EQ(title->get_status(), Status::EXISTING_REMOVED);
    EXPECT_FALSE(root->has_property("title"));

    log.persisted();
    EXPECT_EQ(title->get_status(), Status::REMOVED);
    EXPECT_EQ(root->get_status(), Status::EXISTING);
    EXPECT_EQ(table.purge_removed(), 1u);
}

TEST_F(ChangeLogTest, RemoveIsRevertedOnUndo) {
    ChangeLog log;
    log.add(Remove::create(*title, *root, {}));
    log.undo();
    EXPECT_EQ(title->get_status(), Status::EXISTING);
    EXPECT_TRUE(root->has_property("title"));
}

TEST_F(ChangeLogTest, MixinChangeReloadsAfterPersist) {
    ChangeLog log;
    log.add(SetMixin::create(*root, {"mix:shareable"}));
    log.persisted();
    EXPECT_EQ(root->get_status(), Status::INVALIDATED);
    EXPECT_TRUE(root->entry()->needs_reload());
}

TEST_F(ChangeLogTest, ConsumedTwiceThrows) {
    ChangeLog log;
    log.add(SetPropertyValue::create(*title, PropertyType::STRING, {InternalValue::of_string("x")}));
    log.persisted();
    EXPECT_THROW(log.persisted(), InvalidItemStateError);
    EXPECT_THROW(log.undo(), InvalidItemStateError);
    EXPECT_THROW(log.add(SetMixin::create(*root, {})), InvalidItemStateError);

    log.reset();
    EXPECT_FALSE(log.is_consumed());
    EXPECT_TRUE(log.is_empty());
    EXPECT_TRUE(log.affected_states().empty());
}

TEST_F(ChangeLogTest, IllegalStatusIsCoercedOnPersist) {
    ChangeLog log;
    title->force_status(Status::MODIFIED);
    log.add_affected_state(title);

    // lenient by default
    EXPECT_NO_THROW(log.persisted());
    EXPECT_EQ(title->get_status(), Status::EXISTING);
}

TEST_F(ChangeLogTest, StrictModeThrowsAfterCoercing) {
    ChangeLog log(ItemId(), strict());
    title->force_status(Status::UNDEFINED);
    root->force_status(Status::STALE_MODIFIED);
    log.add_affected_state(title);
    log.add_affected_state(root);

    EXPECT_THROW(log.persisted(), InvalidItemStateError);
    EXPECT_EQ(title->get_status(), Status::EXISTING);
    EXPECT_EQ(root->get_status(), Status::EXISTING);
}

TEST_F(ChangeLogTest, StrictModeUndoOfStrayNewState) {
    ChangeLog log(ItemId(), strict());
    HierarchyEntry& stray = table.add(std::unique_ptr<ItemState>(
        new NodeState(NodeId::random(), root->id(), "nt:base", Status::NEW)));
    log.add_affected_state(stray.state());

    EXPECT_THROW(log.undo(), InvalidItemStateError);
    EXPECT_EQ(stray.state()->get_status(), Status::REMOVED);
}

TEST_F(ChangeLogTest, DuplicateAffectedStatesAreRecordedOnce) {
    ChangeLog log;
    log.add(SetPropertyValue::create(*title, PropertyType::STRING, {InternalValue::of_string("1")}));
    log.add(SetPropertyValue::create(*title, PropertyType::STRING, {InternalValue::of_string("2")}));
    log.add_affected_state(title);
    EXPECT_EQ(log.operations().size(), 2u);
    EXPECT_EQ(log.affected_states().size(), 1u);

    log.undo();
    EXPECT_EQ(title->value().get_string(), "hello");
}
