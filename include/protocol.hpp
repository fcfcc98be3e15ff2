#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace pacsat {

// AX.25 protocol identifiers used by the PACSAT broadcast and FTL0 layers
constexpr uint8_t kPidFileChunk = 0xBB;
constexpr uint8_t kPidDirectory = 0xBD;
constexpr uint8_t kPidFtl0      = 0xF0;

constexpr uint8_t kUiControl = 0x03;

enum BroadcastFlags : uint8_t {
    BF_LAST = 0x40
};

// Byte range [start, end)
struct ByteRange {
    uint32_t start{0};
    uint32_t end{0};
    uint32_t length() const { return end - start; }
    bool operator==(const ByteRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const ByteRange& o) const { return !(*this == o); }
};

// PID 0xBB payload
struct FileChunk {
    uint8_t  flags{0};
    uint32_t file_number{0};
    uint8_t  file_type{0};
    uint32_t offset{0};
    std::vector<uint8_t> data;
};

// PID 0xBD payload
struct DirectoryEntry {
    uint8_t  flags{0};
    uint32_t file_number{0};
    uint32_t offset{0};
    uint32_t t_old{0};
    uint32_t t_new{0};
    std::vector<uint8_t> header;
};

std::vector<uint8_t> encode_file_chunk(const FileChunk& c);
bool decode_file_chunk(const uint8_t* data, size_t len, FileChunk& out);
std::vector<uint8_t> encode_directory_entry(const DirectoryEntry& e);
bool decode_directory_entry(const uint8_t* data, size_t len, DirectoryEntry& out);

// CRC-16/X.25, the AX.25 FCS
uint16_t crc16(const uint8_t* data, size_t len);

inline void put_le16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xFF));
    out.push_back((uint8_t)(v >> 8));
}
inline void put_le32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++)
        out.push_back((uint8_t)(v >> (8 * i)));
}
inline uint16_t get_le16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}
inline uint32_t get_le32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

} // namespace pacsat
