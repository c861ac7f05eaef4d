// End-to-end pipeline scenarios over in-memory buffers and temp files.
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "analyzer.hpp"
#include "logging.hpp"
#include "qov_test_utils.hpp"
#include "qovcheck.hpp"

using namespace qov_test_utils;
using qovcheck::IssueKind;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[analyzer_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_minimal_valid_file() {
    auto res = qovcheck::analyze_buffer(make_minimal_file());
    bool ok = check(res.header.has_value(), "header parsed");
    ok &= check(res.issues.empty(), "no issues");
    ok &= check(res.chunks.empty(), "no chunks");
    ok &= check(res.end_marker_ok, "end marker valid");
    ok &= check(res.valid(), "overall valid");
    return ok;
}

bool test_invalid_reserved() {
    HeaderFields f;
    f.reserved = 0x05;
    auto res = qovcheck::analyze_buffer(make_minimal_file(f));
    bool ok = check(res.issues.size() == 1, "exactly one issue");
    if (!res.issues.empty()) {
        ok &= check(res.issues[0].kind == IssueKind::InvalidReserved, "InvalidReserved");
    }
    ok &= check(!res.valid(), "overall invalid");
    ok &= check(res.end_marker_ok, "end marker check still ran and passed");
    ok &= check(res.chunks.empty(), "chunk walk still ran");
    return ok;
}

bool test_malformed_sync() {
    auto buf = make_header();
    append_chunk(buf, 0x00, 0x01, 4, 0);
    append_sentinel(buf);
    auto res = qovcheck::analyze_buffer(buf);
    bool ok = check(res.issues.size() == 2, "two issues");
    if (res.issues.size() == 2) {
        ok &= check(res.issues[0].kind == IssueKind::ChunkSizeMismatch &&
                        res.issues[0].expected == 8 && res.issues[0].actual == 4,
                    "ChunkSizeMismatch 8/4");
        ok &= check(res.issues[1].kind == IssueKind::ChunkFlagsMismatch &&
                        res.issues[1].expected == 0 && res.issues[1].actual == 1,
                    "ChunkFlagsMismatch 0/1");
    }
    return ok;
}

bool test_issue_order_and_no_short_circuit() {
    HeaderFields f;
    f.magic = "QOVF";
    auto buf = make_header(f);
    append_chunk(buf, 0xFF, 0, 0, 9);  // END with timestamp
    buf.insert(buf.end(), 8, 0x11);    // wrong sentinel
    auto res = qovcheck::analyze_buffer(buf);
    bool ok = check(res.issues.size() == 3, "header, chunk and tail issues all present");
    if (res.issues.size() == 3) {
        ok &= check(res.issues[0].kind == IssueKind::InvalidMagic, "header issue first");
        ok &= check(res.issues[1].kind == IssueKind::ChunkTimestampMismatch, "chunk issue next");
        ok &= check(res.issues[2].kind == IssueKind::InvalidEndMarker, "end marker last");
    }
    return ok;
}

bool test_insufficient_data() {
    std::vector<uint8_t> buf = {'q', 'o', 'v', 'f', 1, 0, 0, 1};
    auto res = qovcheck::analyze_buffer(buf);
    bool ok = check(!res.header.has_value(), "no header");
    ok &= check(res.issues.size() == 1 && res.issues[0].kind == IssueKind::InsufficientData,
                "single InsufficientData issue");
    ok &= check(!res.valid(), "not valid");
    return ok;
}

bool test_sentinel_without_end_chunk() {
    auto buf = make_header();
    for (uint32_t i = 0; i < 3; ++i) {
        append_sync(buf, i);
        append_chunk(buf, 0x01, 0x00, 16, i * 33);
    }
    append_sentinel(buf);
    auto res = qovcheck::analyze_buffer(buf);
    bool has_end = false;
    for (const auto &c : res.chunks) {
        has_end |= c.type == 0xFF;
    }
    bool ok = check(!has_end, "fixture has no END chunk");
    ok &= check(res.end_marker_ok, "end marker still valid");
    ok &= check(res.valid(), "file valid");
    return ok;
}

bool test_determinism() {
    auto buf = make_header();
    append_sync(buf, 0);
    append_chunk(buf, 0x00, 0x03, 2, 0);
    append_chunk(buf, 0x02, 0x00, 0, 0);
    buf.insert(buf.end(), 8, 0x00);
    auto a = qovcheck::analyze_buffer(buf);
    auto b = qovcheck::analyze_buffer(buf);
    bool ok = check(a.header == b.header, "same header");
    ok &= check(a.chunks == b.chunks, "same chunks");
    ok &= check(a.issues == b.issues, "same issues");
    ok &= check(!a.issues.empty(), "fixture does produce issues");
    return ok;
}

bool test_cap_option() {
    auto buf = make_header();
    for (uint32_t i = 0; i < 25; ++i) {
        append_sync(buf, i);
    }
    append_sentinel(buf);
    auto capped = qovcheck::analyze_buffer(buf);
    bool ok = check(capped.chunks.size() == 20, "default cap 20");
    ok &= check(capped.walk_stop == qovcheck::WalkStop::CapReached, "stop reason");
    ok &= check(capped.valid(), "capping is not an issue");

    qovcheck::AnalysisOptions opts;
    opts.max_chunks = 5;
    ok &= check(qovcheck::analyze_buffer(buf, opts).chunks.size() == 5, "configured cap");
    return ok;
}

bool test_file_io() {
    bool ok = true;
    auto path = write_temp_file(make_minimal_file(), "analyzer_unit_valid.qov");
    auto fa = qovcheck::analyze_file(path.string());
    ok &= check(fa.status.ok, "temp file readable");
    ok &= check(fa.file_size == 32, "file size recorded");
    ok &= check(fa.header_bytes.size() == 24, "header bytes captured");
    ok &= check(fa.result.valid(), "temp file valid");
    std::filesystem::remove(path);

    auto missing = qovcheck::analyze_file(
        (std::filesystem::temp_directory_path() / "analyzer_unit_does_not_exist.qov").string());
    ok &= check(!missing.status.ok && !missing.status.message.empty(),
                "missing file is an IO failure");

    auto dir = qovcheck::analyze_file(std::filesystem::temp_directory_path().string());
    ok &= check(!dir.status.ok && !dir.status.message.empty(),
                "directory is an IO failure, not a crash");
    std::vector<uint8_t> dir_bytes;
    ok &= check(!qovcheck::read_file(std::filesystem::temp_directory_path().string(), dir_bytes) &&
                    dir_bytes.empty(),
                "read_file rejects a directory");

    auto tiny = write_temp_file(std::vector<uint8_t>(5, 0), "analyzer_unit_tiny.qov");
    auto fa_tiny = qovcheck::analyze_file(tiny.string());
    ok &= check(fa_tiny.status.ok && !fa_tiny.result.valid() && !fa_tiny.result.header,
                "tiny file opens but has no header");
    std::filesystem::remove(tiny);
    return ok;
}

}  // namespace

int main() {
    qovcheck::set_log_verbosity(qovcheck::LogVerbosity::Error);
    bool ok = true;
    ok &= test_minimal_valid_file();
    ok &= test_invalid_reserved();
    ok &= test_malformed_sync();
    ok &= test_issue_order_and_no_short_circuit();
    ok &= test_insufficient_data();
    ok &= test_sentinel_without_end_chunk();
    ok &= test_determinism();
    ok &= test_cap_option();
    ok &= test_file_io();
    return ok ? 0 : 1;
}
