//
//  header_parser.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "qov_types.hpp"

namespace qovcheck {

// Fixed 24-byte file header; values are kept exactly as read.
struct Header {
    std::string magic;  // 4 raw bytes, not necessarily ASCII.
    uint8_t version = 0;
    uint8_t flags = 0;
    uint16_t width = 0;
    uint16_t height = 0;
    uint16_t fps_num = 0;
    uint16_t fps_den = 0;
    uint32_t total_frames = 0;
    uint8_t audio_channels = 0;
    uint32_t audio_rate = 0;  // u24 on disk.
    uint8_t colorspace = 0;
    uint8_t reserved = 0;

    bool has_index() const { return (flags & kFlagHasIndex) != 0; }

    bool operator==(const Header &o) const {
        return magic == o.magic && version == o.version && flags == o.flags &&
               width == o.width && height == o.height && fps_num == o.fps_num &&
               fps_den == o.fps_den && total_frames == o.total_frames &&
               audio_channels == o.audio_channels && audio_rate == o.audio_rate &&
               colorspace == o.colorspace && reserved == o.reserved;
    }
    bool operator!=(const Header &o) const { return !(*this == o); }
};

// Utility: big-endian reads from a buffer. Callers guarantee offset + width <= size.
uint16_t read_u16_be(const std::vector<uint8_t> &data, size_t offset);
uint32_t read_u24_be(const std::vector<uint8_t> &data, size_t offset);
uint32_t read_u32_be(const std::vector<uint8_t> &data, size_t offset);

// Extract the header fields at their fixed offsets. Returns std::nullopt when the buffer
// is shorter than the header (InsufficientData). No semantic checks happen here.
std::optional<Header> parse_header(const std::vector<uint8_t> &data);

}  // namespace qovcheck
