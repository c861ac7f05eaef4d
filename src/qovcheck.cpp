//
//  qovcheck.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "qovcheck.hpp"
#include "qovcheck_version.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "logging.hpp"

namespace qovcheck {

std::string version_string() { return QOVCHECK_VERSION_DISPLAY; }

bool read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        QC_LOG("error", "not a regular file: " << path
                                               << (ec ? " (" + ec.message() + ")" : std::string()));
        return false;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        QC_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    if (f.fail() || len < 0) {
        QC_LOG("error", "cannot determine size of " << path);
        return false;
    }
    f.seekg(0, std::ios::beg);
    if (f.fail()) {
        QC_LOG("error", "seek failed for " << path);
        return false;
    }
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (f.gcount() != len) {
        QC_LOG("error", "short read for " << path << ": " << f.gcount() << " of " << len
                                          << " bytes");
        return false;
    }
    QC_LOG("io", "read " << out.size() << " bytes from " << path);
    return true;
}

FileAnalysis analyze_file(const std::string &path, const AnalysisOptions &options) {
    FileAnalysis fa;
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes)) {
        fa.status = Status{false, "cannot read " + path};
        return fa;
    }
    fa.file_size = bytes.size();
    const size_t head = std::min(bytes.size(), kHeaderSize);
    fa.header_bytes.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(head));
    fa.result = analyze_buffer(bytes, options);
    fa.status = Status{true, {}};
    return fa;
}

Status compare_files(const std::string &path_a, const std::string &path_b,
                     ComparisonReport &out, FileAnalysis &a, FileAnalysis &b,
                     const AnalysisOptions &analysis_options,
                     const CompareOptions &compare_options) {
    // The two analyses share nothing; both must be complete before diffing.
    a = analyze_file(path_a, analysis_options);
    if (!a.status.ok) {
        return a.status;
    }
    b = analyze_file(path_b, analysis_options);
    if (!b.status.ok) {
        return b.status;
    }
    return compare_results(a.result, b.result, out, compare_options);
}

}  // namespace qovcheck
