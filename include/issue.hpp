//
//  issue.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qovcheck {

/// @ingroup api
/// Closed set of conformance problems a single analysis can report.
enum class IssueKind {
    InvalidMagic,
    InvalidVersion,
    InvalidDimensions,
    InvalidFrameRate,
    InvalidAudioChannels,
    InvalidAudioRate,
    InvalidColorspace,
    InvalidReserved,
    ChunkSizeMismatch,
    ChunkFlagsMismatch,
    ChunkTimestampMismatch,
    InvalidFrameChunkSize,
    MissingEndMarker,
    InvalidEndMarker,
    InsufficientData,
};

/**
 * @brief One structured validation finding.
 *
 * `expected` holds the required value; for range rules (frame chunk size, audio channels,
 * audio rate) it holds the inclusive upper bound, and for set-membership rules (version,
 * colorspace) it is 0. Values that are not numeric (magic, end marker) are carried verbatim
 * in `raw`.
 */
struct Issue {
    IssueKind kind{IssueKind::InsufficientData};
    std::string field;                    ///< Header field or chunk attribute name.
    uint64_t expected = 0;
    uint64_t actual = 0;
    std::optional<uint8_t> chunk_type;    ///< Raw type byte for chunk issues.
    std::optional<uint64_t> chunk_offset; ///< Sub-header offset for chunk issues.
    std::vector<uint8_t> raw;             ///< Actual bytes for magic/end marker issues.

    bool operator==(const Issue &o) const {
        return kind == o.kind && field == o.field && expected == o.expected &&
               actual == o.actual && chunk_type == o.chunk_type &&
               chunk_offset == o.chunk_offset && raw == o.raw;
    }
    bool operator!=(const Issue &o) const { return !(*this == o); }
};

using IssueList = std::vector<Issue>;

// Stable identifier, e.g. "InvalidReserved".
std::string issue_kind_name(IssueKind kind);

// One-line human readable description.
std::string describe_issue(const Issue &issue);

// Append `more` to `into`, preserving order.
void append_issues(IssueList &into, const IssueList &more);

}  // namespace qovcheck
