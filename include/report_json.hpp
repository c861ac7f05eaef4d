//
//  report_json.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "analyzer.hpp"
#include "comparator.hpp"
#include "reporter.hpp"

namespace qovcheck {

// nlohmann/json ADL hooks; found via the qovcheck namespace.
void to_json(nlohmann::json &j, const Header &h);
void to_json(nlohmann::json &j, const ChunkInfo &c);
void to_json(nlohmann::json &j, const Issue &i);
void to_json(nlohmann::json &j, const Report &r);
void to_json(nlohmann::json &j, const FieldDiff &d);
void to_json(nlohmann::json &j, const ChunkDiff &d);
void to_json(nlohmann::json &j, const ComparisonReport &r);

// Full analysis document: header, chunks, issues, end marker, verdict.
nlohmann::json analysis_to_json(const std::string &name, uint64_t file_size,
                                const AnalysisResult &result);

// Indented output. Bytes that are not valid UTF-8 (file names on Linux) are replaced
// with U+FFFD.
std::string dump_json(const nlohmann::json &j);

}  // namespace qovcheck
