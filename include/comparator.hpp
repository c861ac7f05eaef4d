//
//  comparator.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "analyzer.hpp"
#include "chunk_walker.hpp"
#include "header_parser.hpp"

namespace qovcheck {

// Names of the 12 header fields in file order.
extern const char *const kHeaderFieldNames[12];

struct FieldDiff {
    std::string field;
    uint64_t value_a = 0;  // magic is compared as its big-endian fourcc.
    uint64_t value_b = 0;
};

struct ChunkDiff {
    size_t index = 0;
    std::string field;  // "type" or "flags".
    uint64_t value_a = 0;
    uint64_t value_b = 0;
};

struct ChunkComparison {
    bool count_mismatch = false;
    size_t count_a = 0;
    size_t count_b = 0;
    size_t pairs_compared = 0;
    std::vector<ChunkDiff> diffs;
};

struct CompareOptions {
    size_t max_chunk_pairs = 5;  ///< Leading chunk pairs to compare.
};

/**
 * @brief Structured outcome of comparing two analyses.
 *
 * `matches()` ignores `chunks.count_mismatch`; the counts are reported only.
 */
struct ComparisonReport {
    std::vector<FieldDiff> header_diffs;
    ChunkComparison chunks;

    bool header_matches() const { return header_diffs.empty(); }
    bool chunks_match() const { return chunks.diffs.empty(); }
    bool matches() const { return header_matches() && chunks_match(); }
};

// Field-by-field header equality; one FieldDiff per differing field.
std::vector<FieldDiff> diff_headers(const Header &a, const Header &b);

// Compare type and flags of the first min(|a|, |b|, max_pairs) chunk pairs. Size and
// timestamp are not compared.
ChunkComparison diff_chunks(const std::vector<ChunkInfo> &a, const std::vector<ChunkInfo> &b,
                            const CompareOptions &options = {});

// Both results need a header; a failed status leaves `out` untouched.
Status compare_results(const AnalysisResult &a, const AnalysisResult &b, ComparisonReport &out,
                       const CompareOptions &options = {});

}  // namespace qovcheck
