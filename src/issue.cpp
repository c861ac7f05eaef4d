//
//  issue.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "issue.hpp"

#include <sstream>

#include "logging.hpp"
#include "qov_types.hpp"

namespace qovcheck {

std::string issue_kind_name(IssueKind kind) {
    switch (kind) {
        case IssueKind::InvalidMagic:
            return "InvalidMagic";
        case IssueKind::InvalidVersion:
            return "InvalidVersion";
        case IssueKind::InvalidDimensions:
            return "InvalidDimensions";
        case IssueKind::InvalidFrameRate:
            return "InvalidFrameRate";
        case IssueKind::InvalidAudioChannels:
            return "InvalidAudioChannels";
        case IssueKind::InvalidAudioRate:
            return "InvalidAudioRate";
        case IssueKind::InvalidColorspace:
            return "InvalidColorspace";
        case IssueKind::InvalidReserved:
            return "InvalidReserved";
        case IssueKind::ChunkSizeMismatch:
            return "ChunkSizeMismatch";
        case IssueKind::ChunkFlagsMismatch:
            return "ChunkFlagsMismatch";
        case IssueKind::ChunkTimestampMismatch:
            return "ChunkTimestampMismatch";
        case IssueKind::InvalidFrameChunkSize:
            return "InvalidFrameChunkSize";
        case IssueKind::MissingEndMarker:
            return "MissingEndMarker";
        case IssueKind::InvalidEndMarker:
            return "InvalidEndMarker";
        case IssueKind::InsufficientData:
            return "InsufficientData";
    }
    return "Unknown";
}

static std::string printable(const std::vector<uint8_t> &bytes) {
    std::string s;
    for (uint8_t b : bytes) {
        s += (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.';
    }
    return s;
}

static std::string chunk_prefix(const Issue &issue) {
    std::ostringstream oss;
    oss << (issue.chunk_type ? chunk_type_name(*issue.chunk_type) : std::string("chunk"))
        << " chunk";
    if (issue.chunk_offset) {
        oss << " at offset " << *issue.chunk_offset;
    }
    return oss.str();
}

std::string describe_issue(const Issue &issue) {
    std::ostringstream oss;
    switch (issue.kind) {
        case IssueKind::InvalidMagic:
            oss << "Invalid magic bytes: expected '" << kMagic << "', got '"
                << printable(issue.raw) << "'";
            break;
        case IssueKind::InvalidVersion:
            oss << "Invalid version: " << hex_byte(static_cast<uint8_t>(issue.actual))
                << " (expected 0x01 or 0x02)";
            break;
        case IssueKind::InvalidDimensions:
            oss << "Invalid dimensions: " << issue.field << " is " << issue.actual
                << " (must be 1-65535)";
            break;
        case IssueKind::InvalidFrameRate:
            oss << "Invalid frame rate: " << issue.field << " is 0";
            break;
        case IssueKind::InvalidAudioChannels:
            oss << "Invalid audio_channels: " << issue.actual << " (must be 0-"
                << issue.expected << ")";
            break;
        case IssueKind::InvalidAudioRate:
            oss << "Invalid audio_rate: " << issue.actual << " (must be 0-" << issue.expected
                << ")";
            break;
        case IssueKind::InvalidColorspace:
            oss << "Invalid colorspace: " << hex_byte(static_cast<uint8_t>(issue.actual));
            break;
        case IssueKind::InvalidReserved:
            oss << "Invalid reserved byte: " << hex_byte(static_cast<uint8_t>(issue.actual));
            break;
        case IssueKind::ChunkSizeMismatch:
            oss << chunk_prefix(issue) << " should have size " << issue.expected << ", got "
                << issue.actual;
            break;
        case IssueKind::ChunkFlagsMismatch:
            oss << chunk_prefix(issue) << " flags should be "
                << hex_byte(static_cast<uint8_t>(issue.expected)) << ", got "
                << hex_byte(static_cast<uint8_t>(issue.actual));
            break;
        case IssueKind::ChunkTimestampMismatch:
            oss << chunk_prefix(issue) << " timestamp should be " << issue.expected << ", got "
                << issue.actual;
            break;
        case IssueKind::InvalidFrameChunkSize:
            oss << chunk_prefix(issue) << " has invalid frame size " << issue.actual
                << " (must be 1-" << issue.expected << ")";
            break;
        case IssueKind::MissingEndMarker:
            oss << "File too small for end marker (" << issue.actual << " bytes)";
            break;
        case IssueKind::InvalidEndMarker:
            oss << "Invalid end marker: " << hex_prefix(issue.raw)
                << " (expected 00 00 00 00 00 00 00 01)";
            break;
        case IssueKind::InsufficientData:
            oss << "File too small: " << issue.actual << " bytes (need at least "
                << issue.expected << ")";
            break;
    }
    return oss.str();
}

void append_issues(IssueList &into, const IssueList &more) {
    into.insert(into.end(), more.begin(), more.end());
}

}  // namespace qovcheck
