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
#include <cstdlib>
#include <string>

namespace burrow {
    namespace state {

        struct StateConfig {
            /**
             * An illegal status found while a change log is consumed is always
             * logged and coerced. In strict mode the change log additionally
             * throws InvalidItemStateError once every state has been coerced.
             */
            bool strict_status_checks = false;

            static StateConfig defaults() {
                StateConfig cfg;
                if (const char* env = std::getenv("BURROW_STRICT_STATUS_CHECKS")) {
                    cfg.strict_status_checks = std::string(env) == "1" || std::string(env) == "true";
                }
                return cfg;
            }
        };

    }
}
