//
//  reporter.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "reporter.hpp"

namespace qovcheck {

Report make_report(const std::optional<Header> &header, const std::vector<ChunkInfo> &chunks,
                   const IssueList &issues, WalkStop stop) {
    Report r;
    r.valid = issues.empty();
    r.has_header = header.has_value();
    r.total_chunks = chunks.size();
    r.issue_count = issues.size();
    r.scan_capped = stop == WalkStop::CapReached;
    for (const auto &c : chunks) {
        ++r.counts[c.type];
    }
    return r;
}

}  // namespace qovcheck
