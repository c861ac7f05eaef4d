//
//  reporter.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "analyzer.hpp"

namespace qovcheck {

// Verdict plus summary counts; no formatting.
struct Report {
    bool valid = false;
    bool has_header = false;
    size_t total_chunks = 0;
    size_t issue_count = 0;
    bool scan_capped = false;
    std::map<uint8_t, size_t> counts;  // keyed by raw type byte, unknown types included.
};

Report make_report(const std::optional<Header> &header, const std::vector<ChunkInfo> &chunks,
                   const IssueList &issues, WalkStop stop = WalkStop::Exhausted);

inline Report make_report(const AnalysisResult &res) {
    return make_report(res.header, res.chunks, res.issues, res.walk_stop);
}

}  // namespace qovcheck
