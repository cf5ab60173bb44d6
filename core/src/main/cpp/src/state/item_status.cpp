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

#include "item_status.h"

namespace burrow {
    namespace state {

        const char* status_name(Status s) {
            switch (s) {
                case Status::UNDEFINED:         return "UNDEFINED";
                case Status::NEW:               return "NEW";
                case Status::EXISTING:          return "EXISTING";
                case Status::EXISTING_MODIFIED: return "EXISTING_MODIFIED";
                case Status::EXISTING_REMOVED:  return "EXISTING_REMOVED";
                case Status::STALE_MODIFIED:    return "STALE_MODIFIED";
                case Status::STALE_DESTROYED:   return "STALE_DESTROYED";
                case Status::INVALIDATED:       return "INVALIDATED";
                case Status::REMOVED:           return "REMOVED";
                case Status::MODIFIED:          return "MODIFIED";
            }
            return "UNKNOWN";
        }

        bool is_valid_transition(Status from, Status to) {
            if (from == to) {
                return true;
            }
            switch (from) {
                case Status::UNDEFINED:
                case Status::MODIFIED:
                    return true;
                case Status::NEW:
                    // persisted, or discarded
                    return to == Status::EXISTING || to == Status::REMOVED;
                case Status::EXISTING:
                    return to == Status::EXISTING_MODIFIED || to == Status::EXISTING_REMOVED ||
                           to == Status::STALE_DESTROYED || to == Status::INVALIDATED ||
                           to == Status::REMOVED || to == Status::MODIFIED;
                case Status::EXISTING_MODIFIED:
                    return to == Status::EXISTING || to == Status::EXISTING_REMOVED ||
                           to == Status::STALE_MODIFIED || to == Status::STALE_DESTROYED ||
                           to == Status::INVALIDATED || to == Status::MODIFIED;
                case Status::EXISTING_REMOVED:
                    return to == Status::EXISTING || to == Status::REMOVED ||
                           to == Status::STALE_MODIFIED || to == Status::STALE_DESTROYED;
                case Status::STALE_MODIFIED:
                case Status::STALE_DESTROYED:
                    return to == Status::INVALIDATED || to == Status::EXISTING || to == Status::REMOVED;
                case Status::INVALIDATED:
                    return to == Status::EXISTING || to == Status::REMOVED ||
                           to == Status::STALE_DESTROYED;
                case Status::REMOVED:
                    return false;
            }
            return false;
        }

    }
}
