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

#include "blob_store.h"

namespace burrow {
    namespace persist {

        bool BlobStore::holds(const std::string& blob_id, const std::vector<uint8_t>& data) const {
            if (!exists(blob_id)) {
                return false;
            }
            return get(blob_id) == data;
        }

        bool FileSystemBlobStore::holds(const std::string& blob_id, const std::vector<uint8_t>& data) const {
            try {
                if (!fs_.exists(blob_id) || fs_.size(blob_id) != data.size()) {
                    return false;
                }
                return fs_.read(blob_id) == data;
            } catch (const FileSystemError& e) {
                if (e.is_not_found()) {
                    return false;
                }
                throw ItemStateError("failed to read blob " + blob_id, e);
            }
        }

        void FileSystemBlobStore::put(const std::string& blob_id, const std::vector<uint8_t>& data) {
            try {
                std::string folder = ItemFileSystem::parent_of(blob_id);
                if (!fs_.exists(folder)) {
                    fs_.create_folder(folder);
                }
                fs_.write(blob_id, data);
            } catch (const FileSystemError& e) {
                throw ItemStateError("failed to write blob " + blob_id, e);
            }
        }

        std::vector<uint8_t> FileSystemBlobStore::get(const std::string& blob_id) const {
            try {
                return fs_.read(blob_id);
            } catch (const FileSystemError& e) {
                if (e.is_not_found()) {
                    throw NoSuchItemStateError("blob " + blob_id + " not found");
                }
                throw ItemStateError("failed to read blob " + blob_id, e);
            }
        }

        bool FileSystemBlobStore::remove(const std::string& blob_id) {
            try {
                fs_.remove(blob_id);
                return true;
            } catch (const FileSystemError& e) {
                if (e.is_not_found()) {
                    return false;
                }
                throw ItemStateError("failed to remove blob " + blob_id, e);
            }
        }

    }
}
