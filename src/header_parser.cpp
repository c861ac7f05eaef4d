//
//  header_parser.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "header_parser.hpp"

#include "logging.hpp"

namespace qovcheck {

namespace {

// Field offsets within the 24-byte header.
constexpr size_t kOffMagic = 0;
constexpr size_t kOffVersion = 4;
constexpr size_t kOffFlags = 5;
constexpr size_t kOffWidth = 6;
constexpr size_t kOffHeight = 8;
constexpr size_t kOffFpsNum = 10;
constexpr size_t kOffFpsDen = 12;
constexpr size_t kOffTotalFrames = 14;
constexpr size_t kOffAudioChannels = 18;
constexpr size_t kOffAudioRate = 19;
constexpr size_t kOffColorspace = 22;
constexpr size_t kOffReserved = 23;

}  // namespace

uint16_t read_u16_be(const std::vector<uint8_t> &data, size_t offset) {
    return static_cast<uint16_t>((uint16_t(data[offset]) << 8) | uint16_t(data[offset + 1]));
}

uint32_t read_u24_be(const std::vector<uint8_t> &data, size_t offset) {
    return (uint32_t(data[offset]) << 16) | (uint32_t(data[offset + 1]) << 8) |
           (uint32_t(data[offset + 2]));
}

uint32_t read_u32_be(const std::vector<uint8_t> &data, size_t offset) {
    return (uint32_t(data[offset]) << 24) | (uint32_t(data[offset + 1]) << 16) |
           (uint32_t(data[offset + 2]) << 8) | (uint32_t(data[offset + 3]));
}

std::optional<Header> parse_header(const std::vector<uint8_t> &data) {
    if (data.size() < kHeaderSize) {
        QC_LOG("parser", "header needs " << kHeaderSize << " bytes, buffer has " << data.size());
        return std::nullopt;
    }
    Header h;
    // Magic is taken verbatim; a non-ASCII magic is a validation concern, not a parse failure.
    h.magic.assign(reinterpret_cast<const char *>(data.data() + kOffMagic), 4);
    h.version = data[kOffVersion];
    h.flags = data[kOffFlags];
    h.width = read_u16_be(data, kOffWidth);
    h.height = read_u16_be(data, kOffHeight);
    h.fps_num = read_u16_be(data, kOffFpsNum);
    h.fps_den = read_u16_be(data, kOffFpsDen);
    h.total_frames = read_u32_be(data, kOffTotalFrames);
    h.audio_channels = data[kOffAudioChannels];
    h.audio_rate = read_u24_be(data, kOffAudioRate);
    h.colorspace = data[kOffColorspace];
    h.reserved = data[kOffReserved];
    QC_LOG("parser", "header magic=" << hex_prefix(std::vector<uint8_t>(data.begin(),
                                                                         data.begin() + 4))
                                     << " version=" << static_cast<int>(h.version) << " "
                                     << h.width << "x" << h.height);
    return h;
}

}  // namespace qovcheck
