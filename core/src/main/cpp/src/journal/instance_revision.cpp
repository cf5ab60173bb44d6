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

#include "instance_revision.h"
#include "../errors.h"
#include "../persistence/config.h"
#include "../persistence/platform_fs.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <vector>

namespace burrow {
    namespace journal {

        using persist::FSResult;
        using persist::PlatformFS;

        InstanceRevision::InstanceRevision(const std::string& path, bool sync) : path_(path), sync_(sync) {}

        void InstanceRevision::open() {
            revision_ = 0;
            if (path_.empty() || !PlatformFS::exists(path_)) {
                return;
            }
            std::vector<uint8_t> data;
            FSResult r = PlatformFS::read_file(path_, &data);
            if (!r.ok) {
                throw JournalError("Unable to read revision file " + path_ + ": " + errnoWithDescription(r.err));
            }
            if (data.size() != 8) {
                throw JournalError("Revision file " + path_ + " has " + std::to_string(data.size()) +
                                   " bytes, expected 8");
            }
            revision_ = static_cast<int64_t>(util::load_le64(data.data()));
            debug() << "instance revision " << revision_ << " read from " << path_;
        }

        void InstanceRevision::set(int64_t revision) {
            if (!path_.empty()) {
                uint8_t buf[8];
                util::store_le64(buf, static_cast<uint64_t>(revision));
                const std::string tmp = path_ + persist::files::kTempSuffix;
                FSResult r = PlatformFS::write_file(tmp, buf, sizeof(buf), sync_);
                if (r.ok) {
                    r = PlatformFS::atomic_replace(tmp, path_);
                }
                if (!r.ok) {
                    FSResult cleanup = PlatformFS::remove_file(tmp);
                    if (!cleanup.ok && cleanup.err != ENOENT) {
                        warning() << "unable to remove " << tmp << ": " << errnoWithDescription(cleanup.err);
                    }
                    throw JournalError("Unable to write revision file " + path_ + ": " +
                                       errnoWithDescription(r.err));
                }
            }
            revision_ = revision;
        }

    }
}
