//
//  report_format.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "report_format.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>

#include "logging.hpp"
#include "qov_types.hpp"
#include "reporter.hpp"

namespace qovcheck {

namespace {

constexpr const char *kRule = "==================================================";

// True if a header issue names `field`.
bool field_has_issue(const AnalysisResult &res, const char *field) {
    for (const auto &i : res.issues) {
        if (!i.chunk_type && i.field == field) {
            return true;
        }
    }
    return false;
}

const char *mark(bool bad) { return bad ? "[FAIL]" : "[OK]"; }

void format_header(std::ostringstream &os, const AnalysisResult &res) {
    const Header &h = *res.header;
    os << "=== Header Analysis ===\n";
    os << "  Magic: '" << h.magic << "' " << mark(field_has_issue(res, "magic")) << "\n";
    os << "  Version: " << hex_byte(h.version) << " " << mark(field_has_issue(res, "version"))
       << "\n";
    os << "  Flags: " << hex_byte(h.flags) << " [" << describe_header_flags(h.flags)
       << "] (HAS_INDEX=" << (h.has_index() ? "true" : "false") << ")\n";
    os << "  Dimensions: " << h.width << "x" << h.height << " "
       << mark(field_has_issue(res, "width") || field_has_issue(res, "height")) << "\n";
    os << "  Frame rate: " << h.fps_num << "/" << h.fps_den << " "
       << mark(field_has_issue(res, "fps_num") || field_has_issue(res, "fps_den")) << "\n";
    os << "  Total frames: " << h.total_frames << "\n";
    os << "  Audio channels: " << static_cast<int>(h.audio_channels) << " "
       << mark(field_has_issue(res, "audio_channels")) << "\n";
    os << "  Audio rate: " << h.audio_rate << " " << mark(field_has_issue(res, "audio_rate"))
       << "\n";
    os << "  Colorspace: " << hex_byte(h.colorspace) << " (" << colorspace_name(h.colorspace)
       << ") " << mark(field_has_issue(res, "colorspace")) << "\n";
    os << "  Reserved: " << hex_byte(h.reserved) << " " << mark(field_has_issue(res, "reserved"))
       << "\n";
}

void format_chunks(std::ostringstream &os, const AnalysisResult &res, bool verbose) {
    os << "\n=== Chunk Analysis ===\n";
    for (size_t i = 0; i < res.chunks.size(); ++i) {
        const auto &c = res.chunks[i];
        if (verbose) {
            os << "  [" << std::setw(3) << i << "] offset=" << c.offset << " (0x" << std::hex
               << std::uppercase << c.offset << std::dec << std::nouppercase << ") "
               << std::left << std::setw(16) << chunk_type_name(c.type) << std::right
               << " flags=" << hex_byte(c.flags) << " size=" << c.size
               << " ts=" << c.timestamp << "\n";
        }
    }
    os << "  Chunks parsed: " << res.chunks.size() << "\n";
    switch (res.walk_stop) {
        case WalkStop::CapReached:
            os << "  ... (stopped at " << res.chunks.size() << " chunks)\n";
            break;
        case WalkStop::Overrun:
            os << "  Last chunk extends past end of file; scan ended there\n";
            break;
        case WalkStop::Exhausted:
            break;
    }
}

}  // namespace

std::string hex_dump(const std::vector<uint8_t> &bytes) {
    std::ostringstream os;
    for (size_t row = 0; row < bytes.size(); row += 8) {
        const size_t end = std::min(bytes.size(), row + 8);
        std::vector<uint8_t> slice(bytes.begin() + static_cast<std::ptrdiff_t>(row),
                                   bytes.begin() + static_cast<std::ptrdiff_t>(end));
        os << "  " << std::setw(2) << std::setfill('0') << row << std::setfill(' ') << ": "
           << std::left << std::setw(23) << hex_prefix(slice, 8) << std::right << "  ";
        for (uint8_t b : slice) {
            os << ((b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.');
        }
        os << "\n";
    }
    return os.str();
}

std::string format_analysis(const std::string &name, uint64_t file_size,
                            const std::vector<uint8_t> &header_bytes,
                            const AnalysisResult &result, const TextOptions &options) {
    std::ostringstream os;
    os << "=== Analyzing " << name << " ===\n";
    os << "File size: " << file_size << " bytes\n\n";

    if (options.hex_dump && !header_bytes.empty()) {
        os << "Header hex dump:\n" << hex_dump(header_bytes) << "\n";
    }

    if (result.header) {
        format_header(os, result);
        format_chunks(os, result, options.verbose);

        os << "\n=== End Marker Check ===\n";
        if (result.end_marker_ok) {
            os << "  Valid end marker: 00 00 00 00 00 00 00 01\n";
        } else {
            os << "  End marker missing or invalid\n";
        }
    }

    const Report report = make_report(result);
    os << "\n" << kRule << "\n";
    if (report.valid) {
        os << "FILE IS VALID\n";
        os << "Total chunks: " << report.total_chunks << "\n";
        if (!report.counts.empty()) {
            os << "\nChunk summary:\n";
            for (const auto &entry : report.counts) {
                os << "  " << chunk_type_name(entry.first) << ": " << entry.second << "\n";
            }
        }
    } else {
        os << "FILE IS INVALID\n";
        os << "Found " << report.issue_count << " issue(s):\n";
        for (const auto &issue : result.issues) {
            os << "  - " << describe_issue(issue) << "\n";
        }
    }
    return os.str();
}

std::string format_comparison(const std::string &name_a, const std::string &name_b,
                              const AnalysisResult &a, const AnalysisResult &b,
                              const ComparisonReport &report) {
    std::ostringstream os;
    os << "=== Header Comparison ===\n";
    if (report.header_matches()) {
        os << "  All " << (sizeof(kHeaderFieldNames) / sizeof(kHeaderFieldNames[0]))
           << " header fields match\n";
    }
    for (const auto &d : report.header_diffs) {
        os << "  [DIFF] " << d.field << ": " << d.value_a << " vs " << d.value_b << "\n";
    }

    os << "\n=== Chunk Comparison ===\n";
    const size_t pairs =
        std::min({report.chunks.pairs_compared, a.chunks.size(), b.chunks.size()});
    for (size_t i = 0; i < pairs; ++i) {
        const auto &ca = a.chunks[i];
        const auto &cb = b.chunks[i];
        os << "  Chunk " << i << ": " << chunk_type_name(ca.type) << " / "
           << chunk_type_name(cb.type) << "\n";
        os << "    " << name_a << " - Size: " << ca.size << ", Timestamp: " << ca.timestamp
           << "\n";
        os << "    " << name_b << " - Size: " << cb.size << ", Timestamp: " << cb.timestamp
           << "\n";
    }
    for (const auto &d : report.chunks.diffs) {
        os << "  [DIFF] chunk " << d.index << " " << d.field << ": "
           << hex_byte(static_cast<uint8_t>(d.value_a)) << " vs "
           << hex_byte(static_cast<uint8_t>(d.value_b)) << "\n";
    }
    os << "\n  Chunk count: " << report.chunks.count_a << " vs " << report.chunks.count_b
       << (report.chunks.count_mismatch ? " (mismatch)" : "") << "\n";

    os << "\n" << kRule << "\n";
    os << (report.matches() ? "COMPARISON PASSED" : "COMPARISON FAILED") << "\n";
    return os.str();
}

}  // namespace qovcheck
