#include "protocol.hpp"
#include <array>

namespace pacsat {

static constexpr size_t kChunkFixed = 1 + 4 + 1 + 4;
static constexpr size_t kDirFixed = 1 + 4 + 4 + 4 + 4;

uint16_t crc16(const uint8_t *data, size_t len) {
  static std::array<uint16_t, 256> table{};
  static bool inited = false;
  if (!inited) {
    for (uint32_t i = 0; i < 256; i++) {
      uint16_t c = (uint16_t)i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (uint16_t)(0x8408 ^ (c >> 1)) : (uint16_t)(c >> 1);
      table[i] = c;
    }
    inited = true;
  }
  uint16_t c = 0xFFFF;
  for (size_t i = 0; i < len; i++)
    c = (uint16_t)(table[(c ^ data[i]) & 0xFF] ^ (c >> 8));
  return (uint16_t)~c;
}

static void append_crc(std::vector<uint8_t> &out) {
  put_le16(out, crc16(out.data(), out.size()));
}

static bool crc_ok(const uint8_t *data, size_t len) {
  if (len < 2)
    return false;
  return crc16(data, len - 2) == get_le16(data + len - 2);
}

std::vector<uint8_t> encode_file_chunk(const FileChunk &c) {
  std::vector<uint8_t> out;
  out.reserve(kChunkFixed + c.data.size() + 2);
  out.push_back(c.flags);
  put_le32(out, c.file_number);
  out.push_back(c.file_type);
  put_le32(out, c.offset);
  out.insert(out.end(), c.data.begin(), c.data.end());
  append_crc(out);
  return out;
}

bool decode_file_chunk(const uint8_t *data, size_t len, FileChunk &out) {
  if (len < kChunkFixed + 2 || !crc_ok(data, len))
    return false;
  out.flags = data[0];
  out.file_number = get_le32(data + 1);
  out.file_type = data[5];
  out.offset = get_le32(data + 6);
  out.data.assign(data + kChunkFixed, data + len - 2);
  return true;
}

std::vector<uint8_t> encode_directory_entry(const DirectoryEntry &e) {
  std::vector<uint8_t> out;
  out.reserve(kDirFixed + e.header.size() + 2);
  out.push_back(e.flags);
  put_le32(out, e.file_number);
  put_le32(out, e.offset);
  put_le32(out, e.t_old);
  put_le32(out, e.t_new);
  out.insert(out.end(), e.header.begin(), e.header.end());
  append_crc(out);
  return out;
}

bool decode_directory_entry(const uint8_t *data, size_t len,
                            DirectoryEntry &out) {
  if (len < kDirFixed + 2 || !crc_ok(data, len))
    return false;
  out.flags = data[0];
  out.file_number = get_le32(data + 1);
  out.offset = get_le32(data + 5);
  out.t_old = get_le32(data + 9);
  out.t_new = get_le32(data + 13);
  out.header.assign(data + kDirFixed, data + len - 2);
  return true;
}

} // namespace pacsat
