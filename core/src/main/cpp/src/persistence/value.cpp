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

#include "value.h"
#include "../util/endian.hpp"
#include <stdexcept>

namespace burrow {
    namespace persist {

        using namespace burrow::util;

        const char* property_type_name(PropertyType t) {
            switch (t) {
                case PropertyType::STRING:    return "String";
                case PropertyType::BINARY:    return "Binary";
                case PropertyType::LONG:      return "Long";
                case PropertyType::DOUBLE:    return "Double";
                case PropertyType::DATE:      return "Date";
                case PropertyType::BOOLEAN:   return "Boolean";
                case PropertyType::NAME:      return "Name";
                case PropertyType::PATH:      return "Path";
                case PropertyType::REFERENCE: return "Reference";
            }
            return "Unknown";
        }

        PropertyType property_type_from_tag(uint8_t tag) {
            if (tag < static_cast<uint8_t>(PropertyType::STRING) ||
                tag > static_cast<uint8_t>(PropertyType::REFERENCE)) {
                throw std::invalid_argument("unknown property type tag " + std::to_string(tag));
            }
            return static_cast<PropertyType>(tag);
        }

        InternalValue InternalValue::of_string(const std::string& s) {
            InternalValue v;
            v.type_ = PropertyType::STRING;
            v.str_ = s;
            return v;
        }

        InternalValue InternalValue::of_binary(std::vector<uint8_t> data) {
            InternalValue v;
            v.type_ = PropertyType::BINARY;
            v.bin_ = std::move(data);
            return v;
        }

        InternalValue InternalValue::of_long(int64_t n) {
            InternalValue v;
            v.type_ = PropertyType::LONG;
            v.num_ = n;
            return v;
        }

        InternalValue InternalValue::of_double(double d) {
            InternalValue v;
            v.type_ = PropertyType::DOUBLE;
            v.dbl_ = d;
            return v;
        }

        InternalValue InternalValue::of_date(int64_t millis) {
            InternalValue v;
            v.type_ = PropertyType::DATE;
            v.num_ = millis;
            return v;
        }

        InternalValue InternalValue::of_boolean(bool b) {
            InternalValue v;
            v.type_ = PropertyType::BOOLEAN;
            v.num_ = b ? 1 : 0;
            return v;
        }

        InternalValue InternalValue::of_name(const std::string& name) {
            InternalValue v;
            v.type_ = PropertyType::NAME;
            v.str_ = name;
            return v;
        }

        InternalValue InternalValue::of_path(const std::string& path) {
            InternalValue v;
            v.type_ = PropertyType::PATH;
            v.str_ = path;
            return v;
        }

        InternalValue InternalValue::of_reference(const NodeId& target) {
            InternalValue v;
            v.type_ = PropertyType::REFERENCE;
            v.ref_ = target;
            return v;
        }

        void InternalValue::expect(bool ok, const char* what) const {
            if (!ok) {
                throw std::logic_error(std::string("value of type ") + property_type_name(type_) +
                                       " read as " + what);
            }
        }

        const std::string& InternalValue::get_string() const {
            expect(type_ == PropertyType::STRING || type_ == PropertyType::NAME ||
                   type_ == PropertyType::PATH, "string");
            return str_;
        }

        const std::vector<uint8_t>& InternalValue::get_binary() const {
            expect(type_ == PropertyType::BINARY, "binary");
            return bin_;
        }

        int64_t InternalValue::get_long() const {
            expect(type_ == PropertyType::LONG, "long");
            return num_;
        }

        double InternalValue::get_double() const {
            expect(type_ == PropertyType::DOUBLE, "double");
            return dbl_;
        }

        int64_t InternalValue::get_date() const {
            expect(type_ == PropertyType::DATE, "date");
            return num_;
        }

        bool InternalValue::get_boolean() const {
            expect(type_ == PropertyType::BOOLEAN, "boolean");
            return num_ != 0;
        }

        const NodeId& InternalValue::get_reference() const {
            expect(type_ == PropertyType::REFERENCE, "reference");
            return ref_;
        }

        std::vector<uint8_t> InternalValue::to_bytes() const {
            std::vector<uint8_t> out;
            switch (type_) {
                case PropertyType::STRING:
                case PropertyType::NAME:
                case PropertyType::PATH:
                    out.assign(str_.begin(), str_.end());
                    break;
                case PropertyType::BINARY:
                    out = bin_;
                    break;
                case PropertyType::LONG:
                case PropertyType::DATE:
                    out.resize(8);
                    store_le64(out.data(), static_cast<uint64_t>(num_));
                    break;
                case PropertyType::DOUBLE:
                    out.resize(8);
                    store_lef64(out.data(), dbl_);
                    break;
                case PropertyType::BOOLEAN:
                    out.push_back(num_ ? 1 : 0);
                    break;
                case PropertyType::REFERENCE:
                    out.resize(NodeId::kSize);
                    ref_.to_bytes(out.data());
                    break;
            }
            return out;
        }

        InternalValue InternalValue::from_bytes(PropertyType type, const uint8_t* data, size_t len) {
            auto need = [&](size_t n) {
                if (len != n) {
                    throw std::invalid_argument(std::string(property_type_name(type)) + " value of " +
                                                std::to_string(len) + " bytes, expected " +
                                                std::to_string(n));
                }
            };

            switch (type) {
                case PropertyType::STRING:
                    return of_string(std::string(reinterpret_cast<const char*>(data), len));
                case PropertyType::NAME:
                    return of_name(std::string(reinterpret_cast<const char*>(data), len));
                case PropertyType::PATH:
                    return of_path(std::string(reinterpret_cast<const char*>(data), len));
                case PropertyType::BINARY:
                    return of_binary(std::vector<uint8_t>(data, data + len));
                case PropertyType::LONG:
                    need(8);
                    return of_long(static_cast<int64_t>(load_le64(data)));
                case PropertyType::DATE:
                    need(8);
                    return of_date(static_cast<int64_t>(load_le64(data)));
                case PropertyType::DOUBLE:
                    need(8);
                    return of_double(load_lef64(data));
                case PropertyType::BOOLEAN:
                    need(1);
                    return of_boolean(data[0] != 0);
                case PropertyType::REFERENCE:
                    need(NodeId::kSize);
                    return of_reference(NodeId::from_bytes(data));
            }
            throw std::invalid_argument("unknown property type");
        }

        size_t InternalValue::serialized_size() const {
            switch (type_) {
                case PropertyType::STRING:
                case PropertyType::NAME:
                case PropertyType::PATH:
                    return str_.size();
                case PropertyType::BINARY:
                    return bin_.size();
                case PropertyType::LONG:
                case PropertyType::DATE:
                case PropertyType::DOUBLE:
                    return 8;
                case PropertyType::BOOLEAN:
                    return 1;
                case PropertyType::REFERENCE:
                    return NodeId::kSize;
            }
            return 0;
        }

        bool InternalValue::operator==(const InternalValue& o) const {
            if (type_ != o.type_) return false;
            switch (type_) {
                case PropertyType::STRING:
                case PropertyType::NAME:
                case PropertyType::PATH:
                    return str_ == o.str_;
                case PropertyType::BINARY:
                    return bin_ == o.bin_;
                case PropertyType::LONG:
                case PropertyType::DATE:
                case PropertyType::BOOLEAN:
                    return num_ == o.num_;
                case PropertyType::DOUBLE:
                    return dbl_ == o.dbl_;
                case PropertyType::REFERENCE:
                    return ref_ == o.ref_;
            }
            return false;
        }

    }
}
