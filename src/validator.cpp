//
//  validator.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "validator.hpp"

#include <string>
#include <utility>

#include "qov_types.hpp"

namespace qovcheck {

namespace {

Issue field_issue(IssueKind kind, const char *field, uint64_t expected, uint64_t actual) {
    Issue i;
    i.kind = kind;
    i.field = field;
    i.expected = expected;
    i.actual = actual;
    return i;
}

Issue chunk_issue(IssueKind kind, uint8_t type, const char *field, uint64_t expected,
                  uint64_t actual) {
    Issue i = field_issue(kind, field, expected, actual);
    i.chunk_type = type;
    return i;
}

}  // namespace

IssueList validate_header(const Header &h) {
    IssueList issues;

    if (h.magic != kMagic) {
        Issue i = field_issue(IssueKind::InvalidMagic, "magic", fourcc(kMagic), fourcc(h.magic));
        i.raw.assign(h.magic.begin(), h.magic.end());
        issues.push_back(std::move(i));
    }

    if (h.version != 0x01 && h.version != 0x02) {
        issues.push_back(field_issue(IssueKind::InvalidVersion, "version", 0, h.version));
    }

    // flags: only HAS_INDEX is defined for validation purposes; no bits are constrained.

    if (h.width == 0) {
        issues.push_back(field_issue(IssueKind::InvalidDimensions, "width", 1, h.width));
    }
    if (h.height == 0) {
        issues.push_back(field_issue(IssueKind::InvalidDimensions, "height", 1, h.height));
    }

    if (h.fps_num == 0) {
        issues.push_back(field_issue(IssueKind::InvalidFrameRate, "fps_num", 1, h.fps_num));
    }
    if (h.fps_den == 0) {
        issues.push_back(field_issue(IssueKind::InvalidFrameRate, "fps_den", 1, h.fps_den));
    }

    // total_frames is informational.

    if (h.audio_channels > kMaxAudioChannels) {
        issues.push_back(field_issue(IssueKind::InvalidAudioChannels, "audio_channels",
                                     kMaxAudioChannels, h.audio_channels));
    }

    // A parsed u24 always fits; the check guards hand-built headers.
    if (h.audio_rate > kMaxAudioRate) {
        issues.push_back(
            field_issue(IssueKind::InvalidAudioRate, "audio_rate", kMaxAudioRate, h.audio_rate));
    }

    if (!is_known_colorspace(h.colorspace)) {
        issues.push_back(
            field_issue(IssueKind::InvalidColorspace, "colorspace", 0, h.colorspace));
    }

    if (h.reserved != 0) {
        issues.push_back(field_issue(IssueKind::InvalidReserved, "reserved", 0, h.reserved));
    }

    return issues;
}

IssueList validate_chunk(uint8_t type, uint8_t flags, uint32_t size, uint32_t timestamp) {
    IssueList issues;
    switch (chunk_kind(type)) {
        case ChunkType::Sync:
            if (size != kSyncChunkSize) {
                issues.push_back(
                    chunk_issue(IssueKind::ChunkSizeMismatch, type, "size", kSyncChunkSize, size));
            }
            if (flags != 0) {
                issues.push_back(chunk_issue(IssueKind::ChunkFlagsMismatch, type, "flags", 0, flags));
            }
            break;
        case ChunkType::End:
            if (size != 0) {
                issues.push_back(chunk_issue(IssueKind::ChunkSizeMismatch, type, "size", 0, size));
            }
            if (flags != 0) {
                issues.push_back(chunk_issue(IssueKind::ChunkFlagsMismatch, type, "flags", 0, flags));
            }
            if (timestamp != 0) {
                issues.push_back(
                    chunk_issue(IssueKind::ChunkTimestampMismatch, type, "timestamp", 0, timestamp));
            }
            break;
        case ChunkType::Keyframe:
        case ChunkType::Pframe:
            if (size == 0 || size > kMaxFrameChunkSize) {
                issues.push_back(chunk_issue(IssueKind::InvalidFrameChunkSize, type, "size",
                                             kMaxFrameChunkSize, size));
            }
            break;
        case ChunkType::Bframe:
        case ChunkType::Audio:
        case ChunkType::Index:
        case ChunkType::Unknown:
            // No constraints; new rules for these types must be added here explicitly.
            break;
    }
    return issues;
}

}  // namespace qovcheck
