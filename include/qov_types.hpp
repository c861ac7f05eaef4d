//
//  qov_types.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace qovcheck {

// File layout.
inline constexpr size_t kHeaderSize = 24;
inline constexpr size_t kChunkHeaderSize = 10;
inline constexpr size_t kEndMarkerSize = 8;
inline constexpr uint8_t kEndMarker[kEndMarkerSize] = {0, 0, 0, 0, 0, 0, 0, 1};
inline constexpr char kMagic[] = "qovf";

// Header flag bits.
inline constexpr uint8_t kFlagHasAlpha = 0x01;
inline constexpr uint8_t kFlagHasMotion = 0x02;
inline constexpr uint8_t kFlagHasIndex = 0x04;
inline constexpr uint8_t kFlagHasBFrames = 0x08;
inline constexpr uint8_t kFlagEnhancedComp = 0x10;

// Field limits.
inline constexpr uint8_t kMaxAudioChannels = 8;
inline constexpr uint32_t kMaxAudioRate = 0xFFFFFF;  // u24
inline constexpr uint32_t kSyncChunkSize = 8;
inline constexpr uint32_t kMaxFrameChunkSize = 0xFFFFFF;

// Wider than the wire byte so Unknown stays distinct from every type byte.
enum class ChunkType : uint16_t {
    Sync = 0x00,
    Keyframe = 0x01,
    Pframe = 0x02,
    Bframe = 0x03,
    Audio = 0x10,
    Index = 0xF0,
    End = 0xFF,
    Unknown = 0x100,  // never on the wire; see chunk_kind().
};

enum Colorspace : uint8_t {
    kColorspaceSrgb = 0x00,
    kColorspaceSrgba = 0x01,
    kColorspaceLinear = 0x02,
    kColorspaceLinearA = 0x03,
    kColorspaceYuv420 = 0x10,
    kColorspaceYuv422 = 0x11,
    kColorspaceYuv444 = 0x12,
    kColorspaceYuva420 = 0x13,
};

// Magic helper: pack 4 characters big-endian.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

inline uint32_t fourcc(const std::string &s) {
    // Short strings are zero padded; the magic field is always read as 4 raw bytes.
    char b[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < 4 && i < s.size(); ++i) {
        b[i] = s[i];
    }
    return fourcc(b[0], b[1], b[2], b[3]);
}

inline std::string hex_byte(uint8_t v) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<unsigned int>(v);
    return oss.str();
}

inline constexpr ChunkType chunk_kind(uint8_t raw) {
    switch (raw) {
        case 0x00:
            return ChunkType::Sync;
        case 0x01:
            return ChunkType::Keyframe;
        case 0x02:
            return ChunkType::Pframe;
        case 0x03:
            return ChunkType::Bframe;
        case 0x10:
            return ChunkType::Audio;
        case 0xF0:
            return ChunkType::Index;
        case 0xFF:
            return ChunkType::End;
        default:
            return ChunkType::Unknown;
    }
}

inline std::string chunk_type_name(uint8_t raw) {
    switch (chunk_kind(raw)) {
        case ChunkType::Sync:
            return "SYNC";
        case ChunkType::Keyframe:
            return "KEYFRAME";
        case ChunkType::Pframe:
            return "PFRAME";
        case ChunkType::Bframe:
            return "BFRAME";
        case ChunkType::Audio:
            return "AUDIO";
        case ChunkType::Index:
            return "INDEX";
        case ChunkType::End:
            return "END";
        case ChunkType::Unknown:
            break;
    }
    return "UNKNOWN(" + hex_byte(raw) + ")";
}

inline bool is_known_colorspace(uint8_t raw) {
    switch (raw) {
        case kColorspaceSrgb:
        case kColorspaceSrgba:
        case kColorspaceLinear:
        case kColorspaceLinearA:
        case kColorspaceYuv420:
        case kColorspaceYuv422:
        case kColorspaceYuv444:
        case kColorspaceYuva420:
            return true;
        default:
            return false;
    }
}

inline std::string colorspace_name(uint8_t raw) {
    switch (raw) {
        case kColorspaceSrgb:
            return "SRGB";
        case kColorspaceSrgba:
            return "SRGBA";
        case kColorspaceLinear:
            return "LINEAR";
        case kColorspaceLinearA:
            return "LINEAR_A";
        case kColorspaceYuv420:
            return "YUV420";
        case kColorspaceYuv422:
            return "YUV422";
        case kColorspaceYuv444:
            return "YUV444";
        case kColorspaceYuva420:
            return "YUVA420";
        default:
            return "UNKNOWN(" + hex_byte(raw) + ")";
    }
}

// Comma separated list of named header flag bits, "none" if no named bit is set.
inline std::string describe_header_flags(uint8_t flags) {
    static constexpr struct {
        uint8_t bit;
        const char *name;
    } kNames[] = {
        {kFlagHasAlpha, "HAS_ALPHA"},     {kFlagHasMotion, "HAS_MOTION"},
        {kFlagHasIndex, "HAS_INDEX"},     {kFlagHasBFrames, "HAS_BFRAMES"},
        {kFlagEnhancedComp, "ENHANCED_COMP"},
    };
    std::string out;
    for (const auto &n : kNames) {
        if ((flags & n.bit) == 0) {
            continue;
        }
        if (!out.empty()) {
            out += ", ";
        }
        out += n.name;
    }
    return out.empty() ? "none" : out;
}

}  // namespace qovcheck
