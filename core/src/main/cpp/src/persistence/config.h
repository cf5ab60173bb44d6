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
#include <cstddef>

namespace burrow {
namespace persist {

// Bundle wire format
namespace bundle {
    constexpr uint32_t kMagic = 0x4C444E42;                   // "BNDL"
    constexpr uint8_t  kVersion = 2;
    constexpr uint32_t kNoName = 0xFFFFFFFFu;                 // absent name index
    constexpr size_t   kInitialBufferSize = 1024;
    constexpr size_t   kDefaultMinBlobSize = 0x1000;          // 4KB
}

// References record wire format
namespace references {
    constexpr uint32_t kMagic = 0x53464552;                   // "REFS"
    constexpr uint8_t  kVersion = 1;
}

// Embedded block store frames
namespace block_store {
    constexpr uint32_t kFrameMagic = 0x4B4C4242;              // "BBLK"
    constexpr uint8_t  kFramePut = 1;
    constexpr uint8_t  kFrameTombstone = 2;
    // magic(4) type(1) pad(3) id_len(4) data_len(8) data_crc(4) header_crc(4)
    constexpr size_t   kFrameHeaderSize = 28;
    constexpr const char* kContainerFile = "blobs.dat";
    constexpr const char* kCompactSuffix = ".compact";
    // compaction runs once dead frames pass this size and outweigh the live ones
    constexpr uint64_t kCompactMinDeadBytes = 1 << 20;            // 1MB
}

// Name index
namespace name_index {
    constexpr uint32_t kMagic = 0x584D4E42;                   // "BNMX"
    constexpr uint8_t  kVersion = 1;
}

// File naming inside the item filesystem
namespace files {
    constexpr const char* kItemsFolder = "items";
    constexpr const char* kBlobsFolder = "blobs";
    constexpr const char* kNameIndexFile = "names.idx";
    constexpr char kNodeSuffix = 'n';                         // bundle record
    constexpr char kReferencesSuffix = 'r';                   // node references record
    constexpr char kBlobSuffix = 'b';                         // offloaded property value
    constexpr const char* kTempSuffix = ".tmp";
}

} // namespace persist
} // namespace burrow
