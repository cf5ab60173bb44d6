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

#include "endian.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace burrow {
namespace util {

    // Appends little-endian fields to a growable buffer.
    class ByteWriter {
    public:
        explicit ByteWriter(size_t reserve = 1024) { buf_.reserve(reserve); }

        void u8(uint8_t v) { buf_.push_back(v); }

        void u16(uint16_t v) {
            uint8_t b[2];
            store_le16(b, v);
            raw(b, 2);
        }

        void u32(uint32_t v) {
            uint8_t b[4];
            store_le32(b, v);
            raw(b, 4);
        }

        void u64(uint64_t v) {
            uint8_t b[8];
            store_le64(b, v);
            raw(b, 8);
        }

        void i64(int64_t v) { u64(static_cast<uint64_t>(v)); }

        void f64(double v) {
            uint8_t b[8];
            store_lef64(b, v);
            raw(b, 8);
        }

        // u32 length prefix followed by the bytes
        void str(const std::string& s) {
            u32(static_cast<uint32_t>(s.size()));
            raw(s.data(), s.size());
        }

        void bytes(const std::vector<uint8_t>& v) {
            u32(static_cast<uint32_t>(v.size()));
            raw(v.data(), v.size());
        }

        void raw(const void* data, size_t len) {
            const uint8_t* p = static_cast<const uint8_t*>(data);
            buf_.insert(buf_.end(), p, p + len);
        }

        size_t size() const { return buf_.size(); }
        const std::vector<uint8_t>& buffer() const { return buf_; }
        std::vector<uint8_t> release() { return std::move(buf_); }

    private:
        std::vector<uint8_t> buf_;
    };

    // Bounds-checked reader over a byte range; overruns throw std::out_of_range.
    class ByteReader {
    public:
        ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0) {}
        explicit ByteReader(const std::vector<uint8_t>& v) : ByteReader(v.data(), v.size()) {}

        uint8_t u8() {
            need(1);
            return data_[pos_++];
        }

        uint16_t u16() {
            need(2);
            uint16_t v = load_le16(data_ + pos_);
            pos_ += 2;
            return v;
        }

        uint32_t u32() {
            need(4);
            uint32_t v = load_le32(data_ + pos_);
            pos_ += 4;
            return v;
        }

        uint64_t u64() {
            need(8);
            uint64_t v = load_le64(data_ + pos_);
            pos_ += 8;
            return v;
        }

        int64_t i64() { return static_cast<int64_t>(u64()); }

        double f64() {
            need(8);
            double v = load_lef64(data_ + pos_);
            pos_ += 8;
            return v;
        }

        std::string str() {
            uint32_t n = u32();
            need(n);
            std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
            pos_ += n;
            return s;
        }

        std::vector<uint8_t> bytes() {
            uint32_t n = u32();
            return raw(n);
        }

        std::vector<uint8_t> raw(size_t n) {
            need(n);
            std::vector<uint8_t> v(data_ + pos_, data_ + pos_ + n);
            pos_ += n;
            return v;
        }

        void raw(void* out, size_t n) {
            need(n);
            std::memcpy(out, data_ + pos_, n);
            pos_ += n;
        }

        size_t position() const { return pos_; }
        size_t remaining() const { return len_ - pos_; }
        bool at_end() const { return pos_ == len_; }

    private:
        void need(size_t n) const {
            if (n > len_ - pos_) {
                throw std::out_of_range("read of " + std::to_string(n) + " bytes at offset " +
                                        std::to_string(pos_) + " overruns buffer of " +
                                        std::to_string(len_) + " bytes");
            }
        }

        const uint8_t* data_;
        size_t len_;
        size_t pos_;
    };

} // namespace util
} // namespace burrow
