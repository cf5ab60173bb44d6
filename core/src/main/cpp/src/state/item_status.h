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

namespace burrow {
    namespace state {

        /**
         * Relationship of an in-memory item state to its persisted copy.
         *
         * MODIFIED and UNDEFINED only occur while a transaction is being
         * assembled and are never valid once a change log is consumed.
         */
        enum class Status : uint8_t {
            UNDEFINED,
            NEW,
            EXISTING,
            EXISTING_MODIFIED,
            EXISTING_REMOVED,
            STALE_MODIFIED,
            STALE_DESTROYED,
            INVALIDATED,
            REMOVED,
            MODIFIED
        };

        const char* status_name(Status s);

        // Only these may be mutated by an edit
        inline bool is_editable(Status s) {
            return s == Status::NEW || s == Status::EXISTING || s == Status::EXISTING_MODIFIED;
        }

        inline bool is_stale(Status s) {
            return s == Status::STALE_MODIFIED || s == Status::STALE_DESTROYED;
        }

        // Valid once no change log references the state
        inline bool is_terminal(Status s) {
            return s == Status::EXISTING || s == Status::REMOVED || s == Status::INVALIDATED;
        }

        // Pending local modifications against a persisted copy
        inline bool is_transient_change(Status s) {
            return s == Status::EXISTING_MODIFIED || s == Status::EXISTING_REMOVED;
        }

        bool is_valid_transition(Status from, Status to);

    }
}
