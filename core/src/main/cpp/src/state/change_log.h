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
#include <unordered_set>
#include <vector>
#include "operation.h"
#include "state_config.h"

namespace burrow {
    namespace state {

        /**
         * Edits and affected states of one save attempt.
         *
         * The log is consumed by exactly one call to persisted() (the save
         * succeeded) or undo() (it failed); a second call throws
         * InvalidItemStateError until reset(). Unexpected statuses found
         * while consuming are logged and coerced, never left in place.
         */
        class ChangeLog {
        public:
            explicit ChangeLog(const persist::ItemId& target = persist::ItemId(),
                               const StateConfig& config = StateConfig());

            ChangeLog(const ChangeLog&) = delete;
            ChangeLog& operator=(const ChangeLog&) = delete;

            const persist::ItemId& target() const { return target_; }

            // Records op and every state it touched
            void add(std::unique_ptr<Operation> op);

            // A state touched outside of any operation, e.g. an implicitly modified parent
            void add_affected_state(ItemState* s);

            const std::vector<std::unique_ptr<Operation>>& operations() const { return operations_; }
            const std::vector<ItemState*>& affected_states() const { return affected_; }

            bool is_empty() const { return operations_.empty(); }
            bool is_consumed() const { return consumed_; }

            void persisted();
            void undo();

            void reset();

        private:
            void check_not_consumed(const char* what);
            void violation(bool& flag, const char* phase, const ItemState& s);

            persist::ItemId target_;
            StateConfig config_;
            std::vector<std::unique_ptr<Operation>> operations_;
            std::vector<ItemState*> affected_;
            std::unordered_set<const ItemState*> affected_set_;
            bool consumed_ = false;
        };

    }
}
