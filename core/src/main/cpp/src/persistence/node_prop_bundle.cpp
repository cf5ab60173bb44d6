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

#include "node_prop_bundle.h"
#include <algorithm>

namespace burrow {
    namespace persist {

        const PropertyEntry* NodePropBundle::get_property(const std::string& name) const {
            auto it = properties_.find(name);
            return it == properties_.end() ? nullptr : &it->second;
        }

        std::vector<std::string> NodePropBundle::blob_ids() const {
            std::vector<std::string> ids;
            for (const auto& kv : properties_) {
                for (const auto& b : kv.second.blob_ids) {
                    if (!b.empty()) ids.push_back(b);
                }
            }
            return ids;
        }

        bool NodePropBundle::operator==(const NodePropBundle& o) const {
            return id_ == o.id_ &&
                   parent_id_ == o.parent_id_ &&
                   node_type_ == o.node_type_ &&
                   mixins_ == o.mixins_ &&
                   definition_id_ == o.definition_id_ &&
                   referenceable_ == o.referenceable_ &&
                   mod_count_ == o.mod_count_ &&
                   children_ == o.children_ &&
                   properties_ == o.properties_;
        }

        bool NodeReferences::remove_reference(const PropertyId& p) {
            auto it = std::find(refs_.begin(), refs_.end(), p);
            if (it == refs_.end()) {
                return false;
            }
            refs_.erase(it);
            return true;
        }

    }
}
