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

#include "change_log.h"
#include "../errors.h"
#include "../util/log.h"

namespace burrow {
    namespace state {

        ChangeLog::ChangeLog(const persist::ItemId& target, const StateConfig& config)
            : target_(target), config_(config) {}

        void ChangeLog::add(std::unique_ptr<Operation> op) {
            check_not_consumed("add to");
            for (ItemState* s : op->affected_states()) {
                add_affected_state(s);
            }
            operations_.push_back(std::move(op));
        }

        void ChangeLog::add_affected_state(ItemState* s) {
            if (affected_set_.insert(s).second) {
                affected_.push_back(s);
            }
        }

        void ChangeLog::check_not_consumed(const char* what) {
            if (consumed_) {
                throw InvalidItemStateError(std::string("cannot ") + what + " a consumed change log");
            }
        }

        void ChangeLog::violation(bool& flag, const char* phase, const ItemState& s) {
            error() << phase << ": " << s.item_id().to_string() << " has unexpected status "
                    << status_name(s.get_status());
            flag = true;
        }

        void ChangeLog::persisted() {
            check_not_consumed("persist");
            consumed_ = true;

            for (auto& op : operations_) {
                op->persisted();
            }

            bool violated = false;
            for (ItemState* s : affected_) {
                HierarchyEntry* entry = s->entry();
                switch (s->get_status()) {
                    case Status::EXISTING_MODIFIED:
                        s->set_status(Status::EXISTING);
                        if (entry) entry->commit();
                        break;
                    case Status::EXISTING_REMOVED:
                        if (entry) {
                            entry->remove();
                        } else {
                            s->set_status(Status::REMOVED);
                        }
                        break;
                    case Status::NEW:
                        // every NEW state belongs to an add operation
                        violation(violated, "persisted", *s);
                        s->force_status(Status::EXISTING);
                        if (entry) entry->commit();
                        break;
                    case Status::MODIFIED:
                    case Status::UNDEFINED:
                    case Status::STALE_MODIFIED:
                    case Status::STALE_DESTROYED:
                        violation(violated, "persisted", *s);
                        s->force_status(Status::EXISTING);
                        if (entry) entry->commit();
                        break;
                    case Status::EXISTING:
                        if (entry) entry->commit();
                        break;
                    case Status::INVALIDATED:
                    case Status::REMOVED:
                        break;
                }

                // e.g. a changed mixin set: keep the entry, reload it on next access
                if (entry && entry->needs_reload() && s->get_status() == Status::EXISTING) {
                    entry->invalidate(false);
                }
            }

            if (violated && config_.strict_status_checks) {
                throw InvalidItemStateError("change log persisted with illegal item states");
            }
        }

        void ChangeLog::undo() {
            check_not_consumed("undo");
            consumed_ = true;

            for (auto it = operations_.rbegin(); it != operations_.rend(); ++it) {
                (*it)->undo();
            }

            bool violated = false;
            for (ItemState* s : affected_) {
                HierarchyEntry* entry = s->entry();
                switch (s->get_status()) {
                    case Status::EXISTING_MODIFIED:
                    case Status::EXISTING_REMOVED:
                    case Status::STALE_MODIFIED:
                    case Status::STALE_DESTROYED:
                        if (entry) entry->revert();
                        break;
                    case Status::NEW:
                        // operations discard their NEW states when undone
                        violation(violated, "undo", *s);
                        if (entry) {
                            entry->revert();
                        } else {
                            s->force_status(Status::REMOVED);
                        }
                        break;
                    case Status::MODIFIED:
                    case Status::UNDEFINED:
                        violation(violated, "undo", *s);
                        if (entry) {
                            entry->revert();
                        } else {
                            s->force_status(Status::EXISTING);
                        }
                        break;
                    case Status::EXISTING:
                    case Status::INVALIDATED:
                    case Status::REMOVED:
                        break;
                }
            }

            if (violated && config_.strict_status_checks) {
                throw InvalidItemStateError("change log undone with illegal item states");
            }
        }

        void ChangeLog::reset() {
            operations_.clear();
            affected_.clear();
            affected_set_.clear();
            consumed_ = false;
        }

    }
}
