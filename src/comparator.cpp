//
//  comparator.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "comparator.hpp"

#include <algorithm>

#include "logging.hpp"
#include "qov_types.hpp"

namespace qovcheck {

const char *const kHeaderFieldNames[12] = {
    "magic",        "version",        "flags",      "width",
    "height",       "fps_num",        "fps_den",    "total_frames",
    "audio_channels", "audio_rate",   "colorspace", "reserved",
};

namespace {

// Header fields widened to u64, in kHeaderFieldNames order.
std::vector<uint64_t> header_values(const Header &h) {
    return {
        fourcc(h.magic), h.version,    h.flags,          h.width,
        h.height,        h.fps_num,    h.fps_den,        h.total_frames,
        h.audio_channels, h.audio_rate, h.colorspace,    h.reserved,
    };
}

}  // namespace

std::vector<FieldDiff> diff_headers(const Header &a, const Header &b) {
    const auto va = header_values(a);
    const auto vb = header_values(b);
    std::vector<FieldDiff> diffs;
    for (size_t i = 0; i < va.size(); ++i) {
        if (va[i] != vb[i]) {
            diffs.push_back(FieldDiff{kHeaderFieldNames[i], va[i], vb[i]});
            QC_LOG("compare", kHeaderFieldNames[i] << ": " << va[i] << " vs " << vb[i]);
        }
    }
    return diffs;
}

ChunkComparison diff_chunks(const std::vector<ChunkInfo> &a, const std::vector<ChunkInfo> &b,
                            const CompareOptions &options) {
    ChunkComparison out;
    out.count_a = a.size();
    out.count_b = b.size();
    out.count_mismatch = a.size() != b.size();
    out.pairs_compared = std::min({a.size(), b.size(), options.max_chunk_pairs});

    for (size_t i = 0; i < out.pairs_compared; ++i) {
        if (a[i].type != b[i].type) {
            out.diffs.push_back(ChunkDiff{i, "type", a[i].type, b[i].type});
        }
        if (a[i].flags != b[i].flags) {
            out.diffs.push_back(ChunkDiff{i, "flags", a[i].flags, b[i].flags});
        }
    }
    QC_LOG("compare", "compared " << out.pairs_compared << " chunk pairs, "
                                  << out.diffs.size() << " diffs, counts " << out.count_a
                                  << " vs " << out.count_b);
    return out;
}

Status compare_results(const AnalysisResult &a, const AnalysisResult &b, ComparisonReport &out,
                       const CompareOptions &options) {
    if (!a.header || !b.header) {
        return Status{false, !a.header ? "first input has no parsable header"
                                       : "second input has no parsable header"};
    }
    out.header_diffs = diff_headers(*a.header, *b.header);
    out.chunks = diff_chunks(a.chunks, b.chunks, options);
    return Status{true, {}};
}

}  // namespace qovcheck
