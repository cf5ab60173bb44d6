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
#include <string>
#include <vector>
#include "item_id.hpp"

namespace burrow {
    namespace persist {

        enum class PropertyType : uint8_t {
            STRING    = 1,
            BINARY    = 2,
            LONG      = 3,
            DOUBLE    = 4,
            DATE      = 5,      // milliseconds since the epoch, UTC
            BOOLEAN   = 6,
            NAME      = 7,
            PATH      = 8,
            REFERENCE = 9
        };

        const char* property_type_name(PropertyType t);

        // Throws std::invalid_argument for unknown tags
        PropertyType property_type_from_tag(uint8_t tag);

        /**
         * One property value. Text-like types (STRING, NAME, PATH) share the
         * string slot, LONG and DATE share the integer slot.
         */
        class InternalValue {
        public:
            InternalValue() : type_(PropertyType::STRING) {}

            static InternalValue of_string(const std::string& s);
            static InternalValue of_binary(std::vector<uint8_t> data);
            static InternalValue of_long(int64_t v);
            static InternalValue of_double(double v);
            static InternalValue of_date(int64_t millis);
            static InternalValue of_boolean(bool v);
            static InternalValue of_name(const std::string& name);
            static InternalValue of_path(const std::string& path);
            static InternalValue of_reference(const NodeId& target);

            PropertyType type() const { return type_; }

            // Accessors throw std::logic_error on a type mismatch
            const std::string& get_string() const;
            const std::vector<uint8_t>& get_binary() const;
            int64_t get_long() const;
            double get_double() const;
            int64_t get_date() const;
            bool get_boolean() const;
            const NodeId& get_reference() const;

            // Type-specific payload without the type tag
            std::vector<uint8_t> to_bytes() const;
            static InternalValue from_bytes(PropertyType type, const uint8_t* data, size_t len);

            size_t serialized_size() const;

            bool operator==(const InternalValue& o) const;
            bool operator!=(const InternalValue& o) const { return !(*this == o); }

        private:
            void expect(bool ok, const char* what) const;

            PropertyType type_;
            std::string str_;
            std::vector<uint8_t> bin_;
            int64_t num_ = 0;
            double dbl_ = 0.0;
            NodeId ref_;
        };

    }
}
