//
//  end_marker.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "end_marker.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>

#include "logging.hpp"
#include "qov_types.hpp"

namespace qovcheck {

std::optional<Issue> check_end_marker(const std::vector<uint8_t> &data) {
    if (data.size() < kEndMarkerSize) {
        Issue i;
        i.kind = IssueKind::MissingEndMarker;
        i.field = "end_marker";
        i.expected = kEndMarkerSize;
        i.actual = data.size();
        return i;
    }
    const auto tail = data.end() - static_cast<std::ptrdiff_t>(kEndMarkerSize);
    if (std::equal(tail, data.end(), std::begin(kEndMarker))) {
        return std::nullopt;
    }
    Issue i;
    i.kind = IssueKind::InvalidEndMarker;
    i.field = "end_marker";
    i.raw.assign(tail, data.end());
    QC_LOG("parser", "end marker mismatch: " << hex_prefix(i.raw));
    return i;
}

}  // namespace qovcheck
