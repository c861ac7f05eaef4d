//
//  report_json.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "report_json.hpp"

#include "logging.hpp"
#include "qov_types.hpp"

using json = nlohmann::json;

namespace qovcheck {

void to_json(json &j, const Header &h) {
    j = json::object();
    j["magic"] = hex_prefix(std::vector<uint8_t>(h.magic.begin(), h.magic.end()), 4);
    j["version"] = h.version;
    j["flags"] = h.flags;
    j["flag_names"] = describe_header_flags(h.flags);
    j["has_index"] = h.has_index();
    j["width"] = h.width;
    j["height"] = h.height;
    j["fps_num"] = h.fps_num;
    j["fps_den"] = h.fps_den;
    j["total_frames"] = h.total_frames;
    j["audio_channels"] = h.audio_channels;
    j["audio_rate"] = h.audio_rate;
    j["colorspace"] = h.colorspace;
    j["colorspace_name"] = colorspace_name(h.colorspace);
    j["reserved"] = h.reserved;
}

void to_json(json &j, const ChunkInfo &c) {
    j = json{{"type", c.type},
             {"type_name", chunk_type_name(c.type)},
             {"flags", c.flags},
             {"size", c.size},
             {"timestamp", c.timestamp},
             {"offset", c.offset}};
}

void to_json(json &j, const Issue &i) {
    j = json::object();
    j["kind"] = issue_kind_name(i.kind);
    j["field"] = i.field;
    j["expected"] = i.expected;
    j["actual"] = i.actual;
    if (i.chunk_type) {
        j["chunk_type"] = *i.chunk_type;
    }
    if (i.chunk_offset) {
        j["chunk_offset"] = *i.chunk_offset;
    }
    if (!i.raw.empty()) {
        j["raw"] = hex_prefix(i.raw, i.raw.size());
    }
    j["message"] = describe_issue(i);
}

void to_json(json &j, const Report &r) {
    json counts = json::object();
    for (const auto &entry : r.counts) {
        counts[chunk_type_name(entry.first)] = entry.second;
    }
    j = json{{"valid", r.valid},
             {"has_header", r.has_header},
             {"total_chunks", r.total_chunks},
             {"issue_count", r.issue_count},
             {"scan_capped", r.scan_capped},
             {"counts", counts}};
}

void to_json(json &j, const FieldDiff &d) {
    j = json{{"field", d.field}, {"a", d.value_a}, {"b", d.value_b}};
}

void to_json(json &j, const ChunkDiff &d) {
    j = json{{"index", d.index}, {"field", d.field}, {"a", d.value_a}, {"b", d.value_b}};
}

void to_json(json &j, const ComparisonReport &r) {
    j = json::object();
    j["header_matches"] = r.header_matches();
    j["header_diffs"] = r.header_diffs;
    j["chunk_count_a"] = r.chunks.count_a;
    j["chunk_count_b"] = r.chunks.count_b;
    j["count_mismatch"] = r.chunks.count_mismatch;
    j["pairs_compared"] = r.chunks.pairs_compared;
    j["chunk_diffs"] = r.chunks.diffs;
    j["matches"] = r.matches();
}

json analysis_to_json(const std::string &name, uint64_t file_size, const AnalysisResult &result) {
    json j;
    j["file"] = name;
    j["file_size"] = file_size;
    j["header"] = result.header ? json(*result.header) : json(nullptr);
    j["chunks"] = result.chunks;
    j["walk_stop"] = walk_stop_name(result.walk_stop);
    j["end_marker_ok"] = result.end_marker_ok;
    j["issues"] = result.issues;
    j["report"] = make_report(result);
    return j;
}

std::string dump_json(const json &j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace qovcheck
