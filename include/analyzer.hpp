//
//  analyzer.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunk_walker.hpp"
#include "header_parser.hpp"
#include "issue.hpp"

namespace qovcheck {

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., file missing or unreadable, input without a header).
 */
struct Status {
    bool ok{false};
    std::string message;
};

struct AnalysisOptions {
    size_t max_chunks = kDefaultMaxChunks;  ///< Chunk scan cap.
};

/**
 * @brief Everything one pass over a buffer produces.
 *
 * Issues are ordered header, chunks (in file order), end marker. When the buffer cannot
 * hold a header, `header` is empty, the only issue is InsufficientData and neither the
 * chunk walk nor the end marker check runs.
 */
struct AnalysisResult {
    std::optional<Header> header;
    std::vector<ChunkInfo> chunks;
    IssueList issues;
    WalkStop walk_stop = WalkStop::Exhausted;
    bool end_marker_ok = false;

    bool valid() const { return issues.empty(); }
};

// Run header parse, header validation, chunk walk and end marker check over `data`.
AnalysisResult analyze_buffer(const std::vector<uint8_t> &data,
                              const AnalysisOptions &options = {});

}  // namespace qovcheck
