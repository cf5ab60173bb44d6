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
#include "item_fs.h"

namespace burrow {
    namespace persist {

        /**
         * Storage for property values too large to inline into a bundle.
         * Ids are opaque to the store; the bundle codec derives them from
         * (property id, value index, generation).
         */
        class BlobStore {
        public:
            virtual ~BlobStore() = default;

            virtual void put(const std::string& blob_id, const std::vector<uint8_t>& data) = 0;

            // Throws NoSuchItemStateError when absent
            virtual std::vector<uint8_t> get(const std::string& blob_id) const = 0;

            // Returns false when the blob did not exist
            virtual bool remove(const std::string& blob_id) = 0;

            virtual bool exists(const std::string& blob_id) const = 0;

            // True when blob_id exists with exactly these bytes
            virtual bool holds(const std::string& blob_id, const std::vector<uint8_t>& data) const;

            virtual void close() = 0;
        };

        /**
         * Blob store over an item filesystem, one file per blob. The blob id
         * is used as the relative path; its folder is created on demand.
         */
        class FileSystemBlobStore final : public BlobStore {
        public:
            explicit FileSystemBlobStore(ItemFileSystem& fs) : fs_(fs) {}

            void put(const std::string& blob_id, const std::vector<uint8_t>& data) override;
            std::vector<uint8_t> get(const std::string& blob_id) const override;
            bool remove(const std::string& blob_id) override;
            bool exists(const std::string& blob_id) const override { return fs_.exists(blob_id); }
            bool holds(const std::string& blob_id, const std::vector<uint8_t>& data) const override;
            void close() override {}

        private:
            ItemFileSystem& fs_;
        };

    }
}
