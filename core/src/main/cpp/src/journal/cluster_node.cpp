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

#include "cluster_node.h"
#include "change_record.h"
#include "../errors.h"
#include "../util/log.h"
#include <chrono>
#include <memory>
#include <thread>

namespace burrow {
    namespace journal {

        using persist::ChangeSet;
        using persist::NodeId;
        using persist::NodePropBundle;

        ClusterNode::ClusterNode(Journal& journal, persist::PersistenceManager& pm, const ClusterConfig& config)
            : journal_(journal), pm_(pm), config_(config) {
            if (!config_.validate()) {
                throw std::invalid_argument("invalid cluster configuration");
            }
        }

        void ClusterNode::backoff(int attempt) {
            if (config_.retry_backoff_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(config_.retry_backoff_ms * attempt));
            }
        }

        ChangeSet ClusterNode::capture_before_images(const ChangeSet& changes) {
            ChangeSet before;
            auto capture_bundle = [&](const NodeId& id) {
                std::unique_ptr<NodePropBundle> old = pm_.load(id);
                if (old) {
                    before.modified.push_back(*old);
                } else {
                    before.deleted.push_back(id);
                }
            };
            auto capture_refs = [&](const NodeId& target) {
                if (pm_.exists_references(target)) {
                    before.modified_refs.push_back(pm_.load_references(target));
                } else {
                    before.deleted_refs.push_back(target);
                }
            };

            for (const NodePropBundle& b : changes.modified) capture_bundle(b.id());
            for (const NodeId& id : changes.deleted) capture_bundle(id);
            for (const auto& refs : changes.modified_refs) capture_refs(refs.target_id());
            for (const NodeId& id : changes.deleted_refs) capture_refs(id);
            return before;
        }

        void ClusterNode::restore(ChangeSet& before) {
            // deletions in a before-image name items that did not exist yet
            ChangeSet undo;
            undo.modified.swap(before.modified);
            undo.modified_refs.swap(before.modified_refs);
            for (const NodeId& id : before.deleted) {
                if (pm_.exists(id)) undo.deleted.push_back(id);
            }
            for (const NodeId& id : before.deleted_refs) {
                if (pm_.exists_references(id)) undo.deleted_refs.push_back(id);
            }
            pm_.store(undo);
        }

        void ClusterNode::commit(const std::function<void(ChangeSet&)>& prepare) {
            Journal::Consumer consumer = [this](const Record& r) { consume(r); };

            for (int attempt = 1;; ++attempt) {
                try {
                    journal_.lock_and_sync(consumer);
                } catch (const JournalError& e) {
                    if (attempt >= config_.max_commit_attempts) {
                        error() << "journal " << journal_.id() << ": giving up after " << attempt
                                << " attempts: " << e.what();
                        throw;
                    }
                    warning() << "journal " << journal_.id() << ": lock attempt " << attempt
                              << " failed, retrying: " << e.what();
                    backoff(attempt);
                    continue;
                }

                // every attempt prepares from scratch, after the sync above
                ChangeSet changes;
                ChangeSet before;
                bool stored = false;
                try {
                    prepare(changes);
                    if (!changes.empty()) {
                        before = capture_before_images(changes);
                        stored = true;
                        pm_.store(changes);
                        journal_.append(change_record::kProducerId, ChangeRecord::encode(changes));
                    }
                } catch (const JournalError& e) {
                    if (stored) {
                        try {
                            restore(before);
                        } catch (const std::exception& re) {
                            journal_.unlock(false);
                            severe() << "journal " << journal_.id() << ": local store diverges from the journal, "
                                     << "restoring the previous state failed: " << re.what();
                            throw ItemStateError("append failed and the local store could not be restored", re);
                        }
                    }
                    journal_.unlock(false);
                    if (attempt >= config_.max_commit_attempts) {
                        error() << "journal " << journal_.id() << ": giving up after " << attempt
                                << " attempts: " << e.what();
                        throw;
                    }
                    warning() << "journal " << journal_.id() << ": append attempt " << attempt
                              << " failed, retrying: " << e.what();
                    backoff(attempt);
                    continue;
                } catch (const std::exception& e) {
                    if (stored) {
                        try {
                            restore(before);
                        } catch (const std::exception& re) {
                            severe() << "journal " << journal_.id() << ": restoring the local store after "
                                     << e.what() << " failed: " << re.what();
                        }
                    }
                    journal_.unlock(false);
                    throw;
                }
                // the record is committed; the local store is not rolled back from here on
                journal_.unlock(true);
                return;
            }
        }

        void ClusterNode::sync() {
            journal_.sync([this](const Record& r) { consume(r); });
        }

        void ClusterNode::consume(const Record& record) {
            if (record.producer_id != change_record::kProducerId) {
                debug() << "skipping revision " << record.revision << " from producer " << record.producer_id;
                return;
            }
            ChangeSet changes = ChangeRecord::decode(record.data);
            apply(changes);
            ++applied_;
            trace() << "applied revision " << record.revision << " from " << record.journal_id;
            if (listener_) {
                listener_(changes);
            }
        }

        void ClusterNode::apply(const ChangeSet& changes) {
            for (const NodeId& id : changes.deleted_refs) {
                try {
                    pm_.destroy_references(id);
                } catch (const NoSuchItemStateError&) {
                    debug() << "references of " << id.to_string() << " already gone";
                }
            }
            for (const NodeId& id : changes.deleted) {
                try {
                    pm_.destroy(id);
                } catch (const NoSuchItemStateError&) {
                    debug() << "bundle " << id.to_string() << " already gone";
                }
            }
            for (const NodePropBundle& b : changes.modified) {
                NodePropBundle copy(b);
                pm_.store(copy);
            }
            for (const auto& refs : changes.modified_refs) {
                pm_.store_references(refs);
            }
        }

    }
}
