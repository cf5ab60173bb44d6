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
#include <cstdlib>
#include <string>
#include "config.h"

namespace burrow {
namespace persist {

/**
 * Runtime configuration of a bundle persistence manager.
 *
 * blob_fs_block_size selects where offloaded property values live:
 *   0   blobs in a "blobs" directory beside the item store
 *   < 0 blobs inside the item store itself
 *   > 0 embedded block store, one container file, frames aligned to this
 *       power-of-two block size
 */
struct BundleStoreConfig {
    std::string home_dir;
    int32_t     min_blob_size      = bundle::kDefaultMinBlobSize;
    int32_t     blob_fs_block_size = 0;
    bool        sync_writes        = true;

    bool use_local_fs_blob_store() const { return blob_fs_block_size == 0; }
    bool use_item_blob_store() const { return blob_fs_block_size < 0; }
    bool use_block_blob_store() const { return blob_fs_block_size > 0; }

    /**
     * Create config with defaults, optionally reading from environment
     */
    static BundleStoreConfig defaults(const std::string& home = std::string()) {
        BundleStoreConfig cfg;
        cfg.home_dir = home;

        if (const char* env = std::getenv("BURROW_MIN_BLOB_SIZE")) {
            cfg.min_blob_size = static_cast<int32_t>(std::stol(env, nullptr, 0));
        }

        if (const char* env = std::getenv("BURROW_BLOB_FS_BLOCK_SIZE")) {
            cfg.blob_fs_block_size = static_cast<int32_t>(std::stol(env, nullptr, 0));
        }

        if (const char* env = std::getenv("BURROW_SYNC_WRITES")) {
            cfg.sync_writes = std::string(env) != "0";
        }

        return cfg;
    }

    bool validate() const {
        if (min_blob_size < 0) {
            return false;
        }
        if (use_block_blob_store() &&
            (blob_fs_block_size & (blob_fs_block_size - 1)) != 0) {
            // block size must be a power of two
            return false;
        }
        return true;
    }
};

} // namespace persist
} // namespace burrow
