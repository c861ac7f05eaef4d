// Text and JSON renderings of analysis and comparison results.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "qov_test_utils.hpp"
#include "report_format.hpp"
#include "report_json.hpp"

using namespace qov_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[report_output_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

std::vector<uint8_t> small_stream() {
    auto buf = make_header();
    append_sync(buf, 0);
    append_chunk(buf, 0x01, 0x10, 12, 0);
    append_chunk(buf, 0x02, 0x10, 6, 33);
    append_end_chunk(buf);
    append_sentinel(buf);
    return buf;
}

bool test_valid_text() {
    auto buf = small_stream();
    auto res = qovcheck::analyze_buffer(buf);
    std::vector<uint8_t> header_bytes(buf.begin(), buf.begin() + 24);
    qovcheck::TextOptions opts;
    opts.verbose = true;
    opts.hex_dump = true;
    auto text = qovcheck::format_analysis("clip.qov", buf.size(), header_bytes, res, opts);
    bool ok = check(contains(text, "=== Analyzing clip.qov ==="), "title");
    ok &= check(contains(text, "Magic: 'qovf' [OK]"), "magic line");
    ok &= check(contains(text, "Dimensions: 100x50 [OK]"), "dimensions line");
    ok &= check(contains(text, "Header hex dump:"), "hex dump section");
    ok &= check(contains(text, "Chunks parsed: 4"), "chunk count");
    ok &= check(contains(text, "KEYFRAME"), "verbose chunk listing");
    ok &= check(contains(text, "FILE IS VALID"), "valid verdict");
    ok &= check(contains(text, "  PFRAME: 1"), "chunk summary");
    ok &= check(!contains(text, "FILE IS INVALID"), "no invalid verdict");
    return ok;
}

bool test_invalid_text() {
    HeaderFields f;
    f.reserved = 0x05;
    f.width = 0;
    auto buf = make_minimal_file(f);
    auto res = qovcheck::analyze_buffer(buf);
    auto text = qovcheck::format_analysis("bad.qov", buf.size(), {}, res);
    bool ok = check(contains(text, "Dimensions: 0x50 [FAIL]"), "failed field marked");
    ok &= check(contains(text, "FILE IS INVALID"), "invalid verdict");
    ok &= check(contains(text, "Found 2 issue(s):"), "issue count");
    ok &= check(contains(text, "Invalid reserved byte: 0x05"), "issue text listed");
    ok &= check(!contains(text, "Header hex dump:"), "hex dump off by default");
    return ok;
}

bool test_hex_dump() {
    std::vector<uint8_t> bytes = {'q', 'o', 'v', 'f', 0x01, 0x00, 0x00, 0x64, 0xFF};
    auto dump = qovcheck::hex_dump(bytes);
    bool ok = check(contains(dump, "  00: 71 6f 76 66 01 00 00 64  qovf...d\n"), "first row");
    ok &= check(contains(dump, "  08: ff"), "second row offset");
    ok &= check(qovcheck::hex_dump({}).empty(), "empty input");
    return ok;
}

bool test_analysis_json() {
    auto buf = small_stream();
    auto res = qovcheck::analyze_buffer(buf);
    auto j = qovcheck::analysis_to_json("clip.qov", buf.size(), res);
    bool ok = check(j["file"] == "clip.qov", "file name");
    ok &= check(j["file_size"] == buf.size(), "file size");
    ok &= check(j["header"]["width"] == 100 && j["header"]["magic"] == "71 6f 76 66",
                "header fields");
    ok &= check(j["chunks"].size() == 4 && j["chunks"][0]["type_name"] == "SYNC", "chunks");
    ok &= check(j["issues"].empty(), "no issues");
    ok &= check(j["report"]["valid"] == true && j["report"]["counts"]["END"] == 1, "report");
    ok &= check(j["walk_stop"] == "exhausted", "walk stop name");

    auto tiny = qovcheck::analyze_buffer(std::vector<uint8_t>(3, 0));
    auto jt = qovcheck::analysis_to_json("tiny.qov", 3, tiny);
    ok &= check(jt["header"].is_null(), "missing header is null");
    ok &= check(jt["issues"].size() == 1 && jt["issues"][0]["kind"] == "InsufficientData",
                "issue serialized by kind name");
    return ok;
}

bool test_json_dump_replaces_invalid_utf8() {
    auto res = qovcheck::analyze_buffer(make_minimal_file());
    auto j = qovcheck::analysis_to_json("/tmp/bad\xff.qov", 32, res);
    std::string text;
    bool threw = false;
    try {
        text = qovcheck::dump_json(j);
    } catch (const nlohmann::json::exception &e) {
        std::cerr << "[report_output_unit] dump threw: " << e.what() << "\n";
        threw = true;
    }
    bool ok = check(!threw, "dump does not throw on a non UTF-8 name");
    ok &= check(contains(text, "/tmp/bad\xEF\xBF\xBD.qov"), "invalid byte replaced");
    ok &= check(contains(text, "\n  \"file\""), "indented output");
    return ok;
}

bool test_comparison_outputs() {
    auto ra = qovcheck::analyze_buffer(small_stream());
    HeaderFields f;
    f.total_frames = 12;
    auto rb = qovcheck::analyze_buffer(make_minimal_file(f));
    qovcheck::ComparisonReport report;
    bool ok = check(qovcheck::compare_results(ra, rb, report).ok, "compare ok");
    auto text = qovcheck::format_comparison("a.qov", "b.qov", ra, rb, report);
    ok &= check(contains(text, "[DIFF] total_frames: 10 vs 12"), "header diff line");
    ok &= check(contains(text, "Chunk count: 4 vs 0 (mismatch)"), "count line");
    ok &= check(contains(text, "COMPARISON FAILED"), "failed verdict");

    qovcheck::ComparisonReport same;
    ok &= check(qovcheck::compare_results(ra, ra, same).ok, "self compare ok");
    ok &= check(contains(qovcheck::format_comparison("a.qov", "a.qov", ra, ra, same),
                         "COMPARISON PASSED"),
                "passed verdict");

    // A report paired with chunk lists shorter than it was built from.
    qovcheck::ComparisonReport self;
    ok &= check(qovcheck::compare_results(ra, ra, self).ok && self.chunks.pairs_compared == 4,
                "four pairs compared");
    qovcheck::AnalysisResult empty = rb;
    auto mismatched = qovcheck::format_comparison("a.qov", "b.qov", ra, empty, self);
    ok &= check(!contains(mismatched, "Chunk 0:"), "listing clamped to available chunks");
    ok &= check(contains(mismatched, "COMPARISON PASSED"), "verdict still rendered");

    nlohmann::json j = report;
    ok &= check(j["matches"] == false && j["header_diffs"].size() == 1, "comparison json");
    ok &= check(j["header_diffs"][0]["field"] == "total_frames", "diff field name");
    return ok;
}

}  // namespace

int main() {
    qovcheck::set_log_verbosity(qovcheck::LogVerbosity::Error);
    bool ok = true;
    ok &= test_valid_text();
    ok &= test_invalid_text();
    ok &= test_hex_dump();
    ok &= test_analysis_json();
    ok &= test_json_dump_replaces_invalid_utf8();
    ok &= test_comparison_outputs();
    return ok ? 0 : 1;
}
