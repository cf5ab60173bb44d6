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

#include "journal.h"
#include "../errors.h"
#include "../util/log.h"

namespace burrow {
    namespace journal {

        Journal::Journal(const std::string& id, const std::string& revision_path)
            : id_(id), revision_(revision_path) {}

        Journal::~Journal() {
            if (locked_) {
                warning() << "journal " << id_ << " destroyed while locked at revision " << locked_revision_;
                lock_.unlock();
            }
        }

        void Journal::init() {
            revision_.open();
            info() << "journal " << id_ << " at instance revision " << revision_.get();
        }

        void Journal::do_sync(const Consumer& consumer) {
            std::unique_ptr<RecordIterator> it = get_records(revision_.get());
            size_t applied = 0;
            while (it->has_next()) {
                Record record = it->next();
                if (record.journal_id != id_) {
                    consumer(record);
                    ++applied;
                }
                if (record.revision > revision_.get()) {
                    revision_.set(record.revision);
                }
            }
            if (applied > 0) {
                debug() << "journal " << id_ << " synced " << applied << " records up to revision "
                        << revision_.get();
            }
        }

        void Journal::sync(const Consumer& consumer) {
            boost::mutex::scoped_lock guard(lock_);
            do_sync(consumer);
        }

        void Journal::lock_and_sync(const Consumer& consumer) {
            lock_.lock();
            try {
                locked_revision_ = do_lock();
            } catch (const std::exception&) {
                lock_.unlock();
                throw;
            }
            locked_ = true;
            appended_ = false;
            trace() << "journal " << id_ << " locked revision " << locked_revision_;

            try {
                do_sync(consumer);
            } catch (const std::exception& e) {
                error() << "journal " << id_ << " sync under lock failed: " << e.what();
                unlock(false);
                throw;
            }
        }

        int64_t Journal::append(const std::string& producer_id, const std::vector<uint8_t>& data) {
            if (!locked_) {
                throw InvalidItemStateError("journal " + id_ + " must be locked to append");
            }
            Record record;
            record.revision = locked_revision_;
            record.journal_id = id_;
            record.producer_id = producer_id;
            record.data = data;
            do_append(record);
            appended_ = true;
            return locked_revision_;
        }

        void Journal::unlock(bool successful) {
            if (!locked_) {
                throw InvalidItemStateError("journal " + id_ + " is not locked");
            }
            try {
                do_unlock(successful);
            } catch (const std::exception& e) {
                error() << "journal " << id_ << " unlock of revision " << locked_revision_ << " failed: " << e.what();
                locked_ = false;
                lock_.unlock();
                throw;
            }
            locked_ = false;

            if (successful && appended_) {
                try {
                    revision_.set(locked_revision_);
                } catch (const JournalError& e) {
                    // the record is appended; the next sync skips it by journal id
                    warning() << e.what();
                }
            }
            lock_.unlock();
        }

    }
}
