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
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/thread/mutex.hpp>
#include "instance_revision.h"
#include "record.h"

namespace burrow {
    namespace journal {

        /**
         * Ordered, lockable replication log.
         *
         * State machine: UNLOCKED -> lock_and_sync() -> LOCKED -> unlock() ->
         * UNLOCKED. append() is only valid while LOCKED and stamps every
         * record with the revision reserved at lock time, so all records of
         * one locked session share a revision. Within the process the lock
         * is also a mutex: a second locker blocks until unlock().
         *
         * Subclasses provide the storage: do_lock() reserves the next global
         * revision, do_append() writes one record, do_unlock() ends the
         * session and get_records() reads back everything after a revision.
         */
        class Journal {
        public:
            typedef std::function<void(const Record&)> Consumer;

            explicit Journal(const std::string& id, const std::string& revision_path = std::string());
            virtual ~Journal();

            Journal(const Journal&) = delete;
            Journal& operator=(const Journal&) = delete;

            // Opens the instance revision; subclasses open their storage after calling this
            virtual void init();
            virtual void close() {}

            const std::string& id() const { return id_; }

            // Last revision applied by this member
            int64_t instance_revision() const { return revision_.get(); }

            /**
             * Feeds every record newer than the instance revision to consumer,
             * skipping records this member appended itself, and advances the
             * instance revision past each one. A consumer exception stops the
             * sync at that record.
             */
            void sync(const Consumer& consumer);

            /**
             * Reserves the next global revision, then syncs. On failure the
             * journal is left unlocked and the error propagates.
             */
            void lock_and_sync(const Consumer& consumer);

            // Appends one record under the held lock and returns its revision
            int64_t append(const std::string& producer_id, const std::vector<uint8_t>& data);

            /**
             * Ends the locked session. When successful and something was
             * appended the instance revision moves to the locked revision.
             * The lock is released even when do_unlock() throws.
             */
            void unlock(bool successful);

            bool is_locked() const { return locked_; }
            int64_t locked_revision() const { return locked_revision_; }

            // Records with revision > start, ascending
            virtual std::unique_ptr<RecordIterator> get_records(int64_t start) = 0;

        protected:
            virtual int64_t do_lock() = 0;
            virtual void do_append(const Record& record) = 0;
            virtual void do_unlock(bool successful) = 0;

        private:
            void do_sync(const Consumer& consumer);

            std::string id_;
            InstanceRevision revision_;
            boost::mutex lock_;
            bool locked_ = false;
            bool appended_ = false;
            int64_t locked_revision_ = 0;
        };

    }
}
