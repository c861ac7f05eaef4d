//
//  qovcheck.hpp
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
#include "reporter.hpp"

namespace qovcheck {

/// @defgroup api QovCheck Public API
/// Public, supported C++ interfaces for validating and comparing QOV files.
/// @{

/**
 * @brief Return the QovCheck library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Outcome of analysing one file on disk.
 *
 * `result` and `file_size` are only meaningful when `status.ok`. A file that opens but is too
 * short for a header still yields `status.ok == true`; its result carries InsufficientData.
 */
struct FileAnalysis {
    Status status;
    AnalysisResult result;
    uint64_t file_size = 0;
    std::vector<uint8_t> header_bytes;  ///< First (up to) 24 bytes, for hex dumps.
};

/// Read a whole file into memory. Logs and returns false if it cannot be opened or read.
bool read_file(const std::string &path, std::vector<uint8_t> &out);  ///< @ingroup api

/// Load `path` and run the full analysis pipeline over it.
FileAnalysis analyze_file(const std::string &path,
                          const AnalysisOptions &options = {});  ///< @ingroup api

/**
 * @brief Analyse two files independently and compare them.
 *
 * @param path_a First candidate (e.g. output of encoder A).
 * @param path_b Second candidate (e.g. output of encoder B).
 * @param out Filled on success.
 * @param a Receives the analysis of `path_a`.
 * @param b Receives the analysis of `path_b`.
 * @return failed status on IO failure or when either file has no header.
 */
Status compare_files(const std::string &path_a, const std::string &path_b,
                     ComparisonReport &out, FileAnalysis &a, FileAnalysis &b,
                     const AnalysisOptions &analysis_options = {},
                     const CompareOptions &compare_options = {});  ///< @ingroup api

/// @}

}  // namespace qovcheck
