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

#include <string>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>
#include <cstring>

#include "persistence/node_prop_bundle.h"
#include "persistence/value.h"

namespace burrow::persist::test {

// Create a temporary directory for testing
inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    // Generate random suffix
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

inline void remove_temp_dir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

// Generate test data with a pattern
inline std::vector<uint8_t> generate_test_data(size_t size, uint8_t pattern = 0) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; i++) {
        data[i] = pattern + (i % 256);
    }
    return data;
}

// Corrupt a file at a specific offset
inline void corrupt_file(const std::string& path, size_t offset, size_t len) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) return;

    file.seekp(offset);
    std::vector<uint8_t> garbage(len, 0xFF);
    file.write(reinterpret_cast<char*>(garbage.data()), len);
}

// Truncate file to simulate torn write
inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

inline PropertyEntry make_property(const NodeId& node, const std::string& name,
                                   const std::vector<InternalValue>& values, bool multi = false) {
    PropertyEntry p;
    p.id = PropertyId(node, name);
    p.type = values.empty() ? PropertyType::STRING : values.front().type();
    p.multi_valued = multi;
    p.values = values;
    return p;
}

// A node with a couple of properties and children
inline NodePropBundle make_bundle(const NodeId& id = NodeId::random(),
                                  const NodeId& parent = NodeId::random()) {
    NodePropBundle b(id);
    b.set_parent_id(parent);
    b.set_node_type("nt:unstructured");
    b.set_mixins({"mix:referenceable", "mix:lockable"});
    b.set_definition_id("def-node");
    b.set_referenceable(true);
    b.set_mod_count(3);
    b.add_property(make_property(id, "title", {InternalValue::of_string("hello")}));
    b.add_property(make_property(id, "count", {InternalValue::of_long(42)}));
    b.add_property(make_property(id, "tags", {InternalValue::of_name("a"), InternalValue::of_name("b")}, true));
    b.add_child("child", NodeId::random(), 1);
    b.add_child("child", NodeId::random(), 2);
    b.add_child("other", NodeId::random(), 1);
    return b;
}

} // namespace burrow::persist::test
