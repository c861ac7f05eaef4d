//
//  qov_test_utils.hpp
//  QovCheck
//
//  Test-only helpers to build tiny QOV buffers for unit tests.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace qov_test_utils {

inline void write_u16_be(std::vector<uint8_t> &buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void write_u24_be(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void write_u32_be(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

// Literal header fields; defaults describe the minimal valid file.
struct HeaderFields {
    std::string magic = "qovf";
    uint8_t version = 0x01;
    uint8_t flags = 0x00;
    uint16_t width = 100;
    uint16_t height = 50;
    uint16_t fps_num = 30;
    uint16_t fps_den = 1;
    uint32_t total_frames = 10;
    uint8_t audio_channels = 2;
    uint32_t audio_rate = 44100;
    uint8_t colorspace = 0x00;
    uint8_t reserved = 0x00;
};

inline std::vector<uint8_t> make_header(const HeaderFields &f = {}) {
    std::vector<uint8_t> p;
    p.reserve(24);
    for (size_t i = 0; i < 4; ++i) {
        p.push_back(i < f.magic.size() ? static_cast<uint8_t>(f.magic[i]) : 0);
    }
    p.push_back(f.version);
    p.push_back(f.flags);
    write_u16_be(p, f.width);
    write_u16_be(p, f.height);
    write_u16_be(p, f.fps_num);
    write_u16_be(p, f.fps_den);
    write_u32_be(p, f.total_frames);
    p.push_back(f.audio_channels);
    write_u24_be(p, f.audio_rate);
    p.push_back(f.colorspace);
    p.push_back(f.reserved);
    return p;
}

// Append a chunk with a zero-filled payload of `size` bytes.
inline void append_chunk(std::vector<uint8_t> &buf, uint8_t type, uint8_t flags, uint32_t size,
                         uint32_t timestamp) {
    buf.push_back(type);
    buf.push_back(flags);
    write_u32_be(buf, size);
    write_u32_be(buf, timestamp);
    buf.insert(buf.end(), size, 0);
}

// Append only a chunk sub-header declaring `size`, without the payload.
inline void append_chunk_header(std::vector<uint8_t> &buf, uint8_t type, uint8_t flags,
                                uint32_t size, uint32_t timestamp) {
    buf.push_back(type);
    buf.push_back(flags);
    write_u32_be(buf, size);
    write_u32_be(buf, timestamp);
}

// SYNC chunk in the shape the encoders write: "QOVS" + frame number.
inline void append_sync(std::vector<uint8_t> &buf, uint32_t frame) {
    append_chunk_header(buf, 0x00, 0x00, 8, 0);
    buf.insert(buf.end(), {'Q', 'O', 'V', 'S'});
    write_u32_be(buf, frame);
}

inline void append_end_chunk(std::vector<uint8_t> &buf) { append_chunk(buf, 0xFF, 0, 0, 0); }

inline void append_sentinel(std::vector<uint8_t> &buf) {
    buf.insert(buf.end(), {0, 0, 0, 0, 0, 0, 0, 1});
}

// Header + sentinel, no chunks.
inline std::vector<uint8_t> make_minimal_file(const HeaderFields &f = {}) {
    auto buf = make_header(f);
    append_sentinel(buf);
    return buf;
}

inline std::filesystem::path write_temp_file(const std::vector<uint8_t> &data,
                                             const std::string &name) {
    auto p = std::filesystem::temp_directory_path() / name;
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return p;
}

}  // namespace qov_test_utils
