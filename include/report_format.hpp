//
//  report_format.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "analyzer.hpp"
#include "comparator.hpp"

namespace qovcheck {

struct TextOptions {
    bool verbose = false;   // per-chunk listing.
    bool hex_dump = false;  // header hex dump.
};

// Text rendering of a single analysis. Only reads the result.
std::string format_analysis(const std::string &name, uint64_t file_size,
                            const std::vector<uint8_t> &header_bytes,
                            const AnalysisResult &result, const TextOptions &options = {});

// Text rendering of a comparison between inputs labelled `name_a` and `name_b`.
std::string format_comparison(const std::string &name_a, const std::string &name_b,
                              const AnalysisResult &a, const AnalysisResult &b,
                              const ComparisonReport &report);

// 8 bytes per row: offset, hex, ASCII.
std::string hex_dump(const std::vector<uint8_t> &bytes);

}  // namespace qovcheck
