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

#include "bundle_fs_persistence_manager.h"
#include "based_fs.h"
#include "block_blob_store.h"
#include "local_fs.h"
#include "config.h"
#include "../util/log.h"
#include <algorithm>
#include <functional>
#include <set>

namespace burrow {
    namespace persist {

        BundleFsPersistenceManager::BundleFsPersistenceManager(const BundleStoreConfig& config)
            : config_(config) {
            if (config_.home_dir.empty()) {
                throw std::invalid_argument("bundle store needs a home directory");
            }
            wsp_fs_ = std::make_unique<LocalFileSystem>(config_.home_dir, config_.sync_writes);
        }

        BundleFsPersistenceManager::BundleFsPersistenceManager(const BundleStoreConfig& config,
                                                               std::unique_ptr<ItemFileSystem> fs)
            : config_(config), wsp_fs_(std::move(fs)) {
            if (!wsp_fs_) {
                throw std::invalid_argument("bundle store needs a filesystem");
            }
        }

        BundleFsPersistenceManager::~BundleFsPersistenceManager() {
            if (is_initialized()) {
                try {
                    close();
                } catch (const std::exception& e) {
                    warning() << "error closing bundle store: " << e.what();
                }
            }
        }

        std::string BundleFsPersistenceManager::bundle_path(const NodeId& id) {
            return BundleBinding::node_base_path(id) + "." + files::kNodeSuffix;
        }

        std::string BundleFsPersistenceManager::references_path(const NodeId& id) {
            return BundleBinding::node_base_path(id) + "." + files::kReferencesSuffix;
        }

        void BundleFsPersistenceManager::init() {
            std::lock_guard<std::mutex> lock(mu_);
            if (initialized_) {
                throw InvalidItemStateError("bundle store already initialized");
            }
            if (!config_.validate()) {
                throw std::invalid_argument("invalid bundle store configuration");
            }

            try {
                wsp_fs_->init();

                item_fs_ = std::make_unique<BasedFileSystem>(*wsp_fs_, files::kItemsFolder);
                item_fs_->init();

                if (config_.use_block_blob_store()) {
                    if (config_.home_dir.empty()) {
                        throw std::invalid_argument("embedded block store needs a home directory");
                    }
                    auto bs = std::make_unique<BlockBlobStore>(
                        config_.home_dir + "/" + files::kBlobsFolder,
                        static_cast<uint32_t>(config_.blob_fs_block_size), config_.sync_writes);
                    bs->open();
                    blob_store_ = std::move(bs);
                } else if (config_.use_item_blob_store()) {
                    blob_store_ = std::make_unique<FileSystemBlobStore>(*item_fs_);
                } else {
                    blob_fs_ = std::make_unique<BasedFileSystem>(*wsp_fs_, files::kBlobsFolder);
                    blob_fs_->init();
                    blob_store_ = std::make_unique<FileSystemBlobStore>(*blob_fs_);
                }

                names_ = std::make_unique<NameIndex>(*wsp_fs_, files::kNameIndexFile);
                names_->load();

                binding_ = std::make_unique<BundleBinding>(*names_, *blob_store_,
                                                           static_cast<uint32_t>(config_.min_blob_size));
            } catch (const FileSystemError& e) {
                release_components();
                error() << "bundle store init failed: " << e.what();
                throw ItemStateError("bundle store init failed", e);
            } catch (const std::exception& e) {
                release_components();
                error() << "bundle store init failed: " << e.what();
                throw;
            }

            initialized_ = true;
            info() << "bundle store initialized (min blob size " << config_.min_blob_size
                   << ", blob block size " << config_.blob_fs_block_size << ")";
        }

        void BundleFsPersistenceManager::close() {
            std::lock_guard<std::mutex> lock(mu_);
            if (!initialized_) {
                throw InvalidItemStateError("bundle store not initialized");
            }

            std::string first_error;
            auto release = [&](const char* what, const std::function<void()>& fn) {
                try {
                    fn();
                } catch (const std::exception& e) {
                    warning() << "closing " << what << " failed: " << e.what();
                    if (first_error.empty()) first_error = std::string(what) + ": " + e.what();
                }
            };

            release("blob store", [&] { blob_store_->close(); });
            if (blob_fs_) release("blob filesystem", [&] { blob_fs_->close(); });
            release("item filesystem", [&] { item_fs_->close(); });
            release("workspace filesystem", [&] { wsp_fs_->close(); });

            release_components();
            initialized_ = false;

            if (!first_error.empty()) {
                throw ItemStateError("bundle store close failed, " + first_error);
            }
        }

        void BundleFsPersistenceManager::release_components() {
            binding_.reset();
            names_.reset();
            blob_store_.reset();
            blob_fs_.reset();
            item_fs_.reset();
        }

        bool BundleFsPersistenceManager::is_initialized() const {
            std::lock_guard<std::mutex> lock(mu_);
            return initialized_;
        }

        void BundleFsPersistenceManager::check_initialized() const {
            if (!initialized_) {
                throw InvalidItemStateError("bundle store not initialized");
            }
        }

        void BundleFsPersistenceManager::set_min_blob_size(uint32_t size) {
            std::lock_guard<std::mutex> lock(mu_);
            config_.min_blob_size = static_cast<int32_t>(size);
            if (binding_) {
                binding_->set_min_blob_size(size);
            }
        }

        uint32_t BundleFsPersistenceManager::min_blob_size() const {
            std::lock_guard<std::mutex> lock(mu_);
            return static_cast<uint32_t>(config_.min_blob_size);
        }

        std::unique_ptr<NodePropBundle> BundleFsPersistenceManager::load(const NodeId& id) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();

            const std::string path = bundle_path(id);
            try {
                if (!item_fs_->exists(path)) {
                    return nullptr;
                }
                std::vector<uint8_t> data = item_fs_->read(path);
                return std::make_unique<NodePropBundle>(binding_->read_bundle(data));
            } catch (const FileSystemError& e) {
                if (e.is_not_found()) {
                    return nullptr;
                }
                error() << "failed to read bundle " << id.to_string() << ": " << e.what();
                throw ItemStateError("failed to read bundle " + id.to_string(), e);
            } catch (const ItemStateError& e) {
                error() << "failed to read bundle " << id.to_string() << ": " << e.what();
                throw ItemStateError("failed to read bundle " + id.to_string(), e);
            }
        }

        void BundleFsPersistenceManager::store(NodePropBundle& bundle) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();
            store_locked(bundle);
        }

        void BundleFsPersistenceManager::store_locked(NodePropBundle& bundle) {
            const std::string path = bundle_path(bundle.id());
            std::unique_ptr<NodePropBundle> stored = stored_bundle_locked(bundle.id());
            std::vector<std::string> previous;
            if (stored) {
                previous = stored->blob_ids();
            }
            // new blobs go under fresh ids; the stored record stays valid until replaced
            std::vector<std::string> written;

            try {
                const std::string folder = ItemFileSystem::parent_of(path);
                if (!item_fs_->exists(folder)) {
                    item_fs_->create_folder(folder);
                }
                std::vector<uint8_t> data = binding_->write_bundle(bundle, stored.get(), &written);
                item_fs_->write(path, data);
                bundle.set_size(data.size());
            } catch (const FileSystemError& e) {
                error() << "failed to write bundle " << bundle.id().to_string() << ": " << e.what();
                remove_blobs_locked(written);
                throw ItemStateError("failed to write bundle " + bundle.id().to_string(), e);
            } catch (const ItemStateError& e) {
                error() << "failed to write bundle " << bundle.id().to_string() << ": " << e.what();
                remove_blobs_locked(written);
                throw ItemStateError("failed to write bundle " + bundle.id().to_string(), e);
            }

            // blobs of values that changed, moved inline or disappeared
            std::vector<std::string> current = bundle.blob_ids();
            std::set<std::string> keep(current.begin(), current.end());
            std::vector<std::string> orphans;
            for (const auto& b : previous) {
                if (!keep.count(b)) orphans.push_back(b);
            }
            remove_blobs_locked(orphans);
        }

        std::unique_ptr<NodePropBundle> BundleFsPersistenceManager::stored_bundle_locked(const NodeId& id) {
            const std::string path = bundle_path(id);
            try {
                if (!item_fs_->exists(path)) {
                    return nullptr;
                }
                return std::make_unique<NodePropBundle>(binding_->read_bundle(item_fs_->read(path), false));
            } catch (const std::exception& e) {
                warning() << "cannot inspect stored bundle " << id.to_string()
                          << ", its blobs are not reused or cleaned up: " << e.what();
                return nullptr;
            }
        }

        std::vector<std::string> BundleFsPersistenceManager::stored_blob_ids_locked(const NodeId& id) {
            std::unique_ptr<NodePropBundle> stored = stored_bundle_locked(id);
            return stored ? stored->blob_ids() : std::vector<std::string>();
        }

        void BundleFsPersistenceManager::remove_blobs_locked(const std::vector<std::string>& ids) {
            for (const auto& b : ids) {
                try {
                    if (!blob_store_->remove(b)) {
                        debug() << "blob " << b << " already gone";
                    }
                } catch (const std::exception& e) {
                    warning() << "failed to remove blob " << b << ": " << e.what();
                }
            }
        }

        void BundleFsPersistenceManager::destroy(const NodeId& id) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();
            destroy_locked(id);
        }

        void BundleFsPersistenceManager::destroy_locked(const NodeId& id) {
            const std::string path = bundle_path(id);
            std::vector<std::string> blobs = stored_blob_ids_locked(id);

            try {
                item_fs_->remove(path);
            } catch (const FileSystemError& e) {
                if (e.is_not_found()) {
                    throw NoSuchItemStateError("bundle " + id.to_string() + " not found");
                }
                error() << "failed to delete bundle " << id.to_string() << ": " << e.what();
                throw ItemStateError("failed to delete bundle " + id.to_string(), e);
            }

            remove_blobs_locked(blobs);
        }

        bool BundleFsPersistenceManager::exists(const NodeId& id) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();
            return item_fs_->exists(bundle_path(id));
        }

        NodeReferences BundleFsPersistenceManager::load_references(const NodeId& target) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();

            const std::string path = references_path(target);
            try {
                return binding_->read_references(item_fs_->read(path));
            } catch (const FileSystemError& e) {
                if (e.is_not_found()) {
                    throw NoSuchItemStateError("references of " + target.to_string() + " not found");
                }
                error() << "failed to read references of " << target.to_string() << ": " << e.what();
                throw ItemStateError("failed to read references of " + target.to_string(), e);
            } catch (const NoSuchItemStateError& e) {
                // an unknown name index inside an existing record is corruption
                error() << "failed to read references of " << target.to_string() << ": " << e.what();
                throw ItemStateError("failed to read references of " + target.to_string(), e);
            }
        }

        void BundleFsPersistenceManager::store_references(const NodeReferences& refs) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();
            store_references_locked(refs);
        }

        void BundleFsPersistenceManager::store_references_locked(const NodeReferences& refs) {
            const std::string path = references_path(refs.target_id());
            try {
                const std::string folder = ItemFileSystem::parent_of(path);
                if (!item_fs_->exists(folder)) {
                    item_fs_->create_folder(folder);
                }
                item_fs_->write(path, binding_->write_references(refs));
            } catch (const FileSystemError& e) {
                error() << "failed to write references of " << refs.target_id().to_string() << ": " << e.what();
                throw ItemStateError("failed to write references of " + refs.target_id().to_string(), e);
            }
        }

        void BundleFsPersistenceManager::destroy_references(const NodeId& target) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();
            destroy_references_locked(target);
        }

        void BundleFsPersistenceManager::destroy_references_locked(const NodeId& target) {
            try {
                item_fs_->remove(references_path(target));
            } catch (const FileSystemError& e) {
                if (e.is_not_found()) {
                    throw NoSuchItemStateError("references of " + target.to_string() + " not found");
                }
                error() << "failed to delete references of " << target.to_string() << ": " << e.what();
                throw ItemStateError("failed to delete references of " + target.to_string(), e);
            }
        }

        bool BundleFsPersistenceManager::exists_references(const NodeId& target) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();
            return item_fs_->exists(references_path(target));
        }

        void BundleFsPersistenceManager::store(ChangeSet& changes) {
            std::lock_guard<std::mutex> lock(mu_);
            check_initialized();

            for (const auto& id : changes.deleted_refs) {
                destroy_references_locked(id);
            }
            for (const auto& id : changes.deleted) {
                destroy_locked(id);
            }
            for (auto& b : changes.modified) {
                store_locked(b);
            }
            for (const auto& r : changes.modified_refs) {
                store_references_locked(r);
            }

            debug() << "stored change set: " << changes.modified.size() << " bundles, "
                    << changes.deleted.size() << " deletions, " << changes.modified_refs.size()
                    << " reference records, " << changes.deleted_refs.size() << " reference deletions";
        }

    }
}
