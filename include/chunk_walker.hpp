//
//  chunk_walker.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "issue.hpp"
#include "qov_types.hpp"

namespace qovcheck {

struct ChunkInfo {
    uint8_t type = 0;
    uint8_t flags = 0;
    uint32_t size = 0;       // payload length; payload stays opaque.
    uint32_t timestamp = 0;
    uint64_t offset = 0;     // position of the 10-byte sub-header.

    ChunkType kind() const { return chunk_kind(type); }

    bool operator==(const ChunkInfo &o) const {
        return type == o.type && flags == o.flags && size == o.size &&
               timestamp == o.timestamp && offset == o.offset;
    }
    bool operator!=(const ChunkInfo &o) const { return !(*this == o); }
};

// Why the scan ended.
enum class WalkStop {
    Exhausted,   // fewer than 10 bytes left at the next position.
    CapReached,  // chunk cap hit; the list is truncated for display, not a format problem.
    Overrun,     // last chunk's declared size moved the position past the buffer end.
};

inline constexpr size_t kDefaultMaxChunks = 20;

struct WalkResult {
    std::vector<ChunkInfo> chunks;
    IssueList issues;
    WalkStop stop = WalkStop::Exhausted;
    uint64_t next_offset = 0;
};

const char *walk_stop_name(WalkStop stop);

// Walk the chunk sequence starting right after the header. Each chunk is checked with
// validate_chunk(). An oversized `size` is not an error: the walk simply ends, reporting
// WalkStop::Overrun.
WalkResult walk_chunks(const std::vector<uint8_t> &data, size_t max_chunks = kDefaultMaxChunks);

}  // namespace qovcheck
