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
#include <memory>
#include <mutex>
#include <string>
#include "persistence_manager.h"
#include "storage_config.h"
#include "item_fs.h"
#include "blob_store.h"
#include "name_index.h"
#include "bundle_binding.h"

namespace burrow {
    namespace persist {

        /**
         * Bundle persistence over an item filesystem.
         *
         * Layout under the workspace filesystem:
         *   names.idx                    shared name index
         *   items/ab/cd/ef/<uuid>.n      node bundle
         *   items/ab/cd/ef/<uuid>.r      node references
         *   blobs/...                    offloaded values (blob_fs_block_size == 0)
         *
         * Every operation runs under one manager-wide mutex.
         */
        class BundleFsPersistenceManager final : public PersistenceManager {
        public:
            // Uses a LocalFileSystem rooted at config.home_dir
            explicit BundleFsPersistenceManager(const BundleStoreConfig& config);

            // Uses fs as the workspace filesystem, e.g. a MemoryFileSystem
            BundleFsPersistenceManager(const BundleStoreConfig& config, std::unique_ptr<ItemFileSystem> fs);

            ~BundleFsPersistenceManager() override;

            void init() override;
            void close() override;

            std::unique_ptr<NodePropBundle> load(const NodeId& id) override;
            void store(NodePropBundle& bundle) override;
            using PersistenceManager::destroy;
            void destroy(const NodeId& id) override;
            bool exists(const NodeId& id) override;

            NodeReferences load_references(const NodeId& target) override;
            void store_references(const NodeReferences& refs) override;
            void destroy_references(const NodeId& target) override;
            bool exists_references(const NodeId& target) override;

            void store(ChangeSet& changes) override;

            // Applies to bundles stored from now on; existing bundles keep their layout
            void set_min_blob_size(uint32_t size);
            uint32_t min_blob_size() const;

            bool is_initialized() const;

            static std::string bundle_path(const NodeId& id);
            static std::string references_path(const NodeId& id);

        private:
            void check_initialized() const;
            void release_components();

            void store_locked(NodePropBundle& bundle);
            void destroy_locked(const NodeId& id);
            void store_references_locked(const NodeReferences& refs);
            void destroy_references_locked(const NodeId& target);

            // The bundle currently on disk without its blobs, nullptr if none or unreadable
            std::unique_ptr<NodePropBundle> stored_bundle_locked(const NodeId& id);
            // Blob ids of the bundle currently on disk, empty if none
            std::vector<std::string> stored_blob_ids_locked(const NodeId& id);
            void remove_blobs_locked(const std::vector<std::string>& ids);

            BundleStoreConfig config_;
            mutable std::mutex mu_;
            bool initialized_ = false;

            std::unique_ptr<ItemFileSystem> wsp_fs_;
            std::unique_ptr<ItemFileSystem> item_fs_;
            std::unique_ptr<ItemFileSystem> blob_fs_;
            std::unique_ptr<BlobStore> blob_store_;
            std::unique_ptr<NameIndex> names_;
            std::unique_ptr<BundleBinding> binding_;
        };

    }
}
