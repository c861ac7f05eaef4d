//
//  chunk_walker.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "chunk_walker.hpp"

#include "header_parser.hpp"
#include "logging.hpp"
#include "validator.hpp"

namespace qovcheck {

const char *walk_stop_name(WalkStop stop) {
    switch (stop) {
        case WalkStop::Exhausted:
            return "exhausted";
        case WalkStop::CapReached:
            return "cap_reached";
        case WalkStop::Overrun:
            return "overrun";
    }
    return "unknown";
}

static ChunkInfo read_chunk_header(const std::vector<uint8_t> &data, uint64_t pos) {
    const auto p = static_cast<size_t>(pos);
    ChunkInfo c;
    c.offset = pos;
    c.type = data[p];
    c.flags = data[p + 1];
    c.size = read_u32_be(data, p + 2);
    c.timestamp = read_u32_be(data, p + 6);
    return c;
}

WalkResult walk_chunks(const std::vector<uint8_t> &data, size_t max_chunks) {
    WalkResult out;
    const uint64_t total = data.size();
    uint64_t pos = kHeaderSize;

    auto remaining = [&]() -> uint64_t { return pos < total ? total - pos : 0; };

    // No bounds check on pos + 10 + size: an oversized chunk ends the loop through the
    // remaining-bytes condition instead of raising an error.
    while (remaining() >= kChunkHeaderSize && out.chunks.size() < max_chunks) {
        ChunkInfo c = read_chunk_header(data, pos);
        QC_LOG("walker", "chunk " << out.chunks.size() << " " << chunk_type_name(c.type)
                                  << " offset=" << c.offset << " flags=" << hex_byte(c.flags)
                                  << " size=" << c.size << " ts=" << c.timestamp);

        IssueList chunk_issues = validate_chunk(c.type, c.flags, c.size, c.timestamp);
        for (auto &issue : chunk_issues) {
            issue.chunk_offset = c.offset;
        }
        append_issues(out.issues, chunk_issues);

        out.chunks.push_back(c);
        pos += kChunkHeaderSize + c.size;
    }

    out.next_offset = pos;
    if (pos > total && !out.chunks.empty()) {
        out.stop = WalkStop::Overrun;
        QC_LOG("walker", "chunk at offset " << out.chunks.back().offset << " declares "
                                            << out.chunks.back().size
                                            << " payload bytes, past end of buffer (" << total
                                            << "); scan stopped");
    } else if (remaining() >= kChunkHeaderSize) {
        out.stop = WalkStop::CapReached;
        QC_LOG("info", "chunk scan stopped at " << out.chunks.size() << " chunks");
    } else {
        out.stop = WalkStop::Exhausted;
    }
    return out;
}

}  // namespace qovcheck
