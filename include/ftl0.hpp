#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include "protocol.hpp"

namespace pacsat {

enum class ProtocolError : uint8_t {
    Ok = 0,
    Malformed,
    UnexpectedMessage,
    NoSuchSession,
    NoSuchFile,
    BadChunkCrc,
    FileTooLarge,
    HeaderRejected,
    BodyRejected,
    Busy
};

const char* to_string(ProtocolError e);

enum class Ftl0Type : uint8_t {
    Data        = 0,
    DataEnd     = 1,
    UploadCmd   = 3,
    UlGoResp    = 4,
    UlErrorResp = 5,
    UlAckResp   = 6,
    UlNakResp   = 7,
    HoleList    = 8,
    DlRequest   = 9,
    DlAck       = 10,
    DlDone      = 11
};

const char* to_string(Ftl0Type t);

constexpr uint8_t kDlBroadcast = 0x01;
constexpr size_t kFtl0MaxBody = 0x7FF;  // 11-bit length

// One FTL0 packet. Which fields travel depends on the type:
//   Data        file_number offset data (CRC added on encode)
//   DataEnd     file_number
//   UploadCmd   file_number (continue, 0 = new) length
//   UlGoResp    file_number holes
//   UlErrorResp error
//   UlAckResp   file_number
//   UlNakResp   file_number error
//   HoleList    file_number holes
//   DlRequest   file_number flags holes
//   DlAck       file_number
//   DlDone      file_number length
struct Ftl0Packet {
    Ftl0Type type{Ftl0Type::Data};
    uint32_t file_number{0};
    uint32_t offset{0};
    uint32_t length{0};
    uint8_t flags{0};
    ProtocolError error{ProtocolError::Ok};
    std::vector<ByteRange> holes;
    std::vector<uint8_t> data;

    bool broadcast() const { return (flags & kDlBroadcast) != 0; }
};

// Returns false when the body would not fit the 11-bit length field.
bool encode_ftl0(const Ftl0Packet& p, std::vector<uint8_t>& out);
ProtocolError decode_ftl0(const uint8_t* data, size_t len, Ftl0Packet& out);

} // namespace pacsat
