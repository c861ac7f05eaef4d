//
//  analyzer.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "analyzer.hpp"

#include <utility>

#include "end_marker.hpp"
#include "logging.hpp"
#include "validator.hpp"

namespace qovcheck {

AnalysisResult analyze_buffer(const std::vector<uint8_t> &data, const AnalysisOptions &options) {
    AnalysisResult res;

    res.header = parse_header(data);
    if (!res.header) {
        Issue i;
        i.kind = IssueKind::InsufficientData;
        i.field = "header";
        i.expected = kHeaderSize;
        i.actual = data.size();
        res.issues.push_back(std::move(i));
        QC_LOG("warn", "buffer of " << data.size() << " bytes cannot hold a header");
        return res;
    }

    // Header problems never stop the rest of the pass.
    append_issues(res.issues, validate_header(*res.header));

    WalkResult walk = walk_chunks(data, options.max_chunks);
    res.chunks = std::move(walk.chunks);
    res.walk_stop = walk.stop;
    append_issues(res.issues, walk.issues);

    auto marker = check_end_marker(data);
    res.end_marker_ok = !marker.has_value();
    if (marker) {
        res.issues.push_back(std::move(*marker));
    }

    QC_LOG("analyzer", "analysis done: chunks=" << res.chunks.size()
                                                << " issues=" << res.issues.size()
                                                << " stop=" << walk_stop_name(res.walk_stop));
    return res;
}

}  // namespace qovcheck
