#include "ftl0.hpp"

namespace pacsat {

const char *to_string(ProtocolError e) {
  switch (e) {
  case ProtocolError::Ok:
    return "ok";
  case ProtocolError::Malformed:
    return "malformed packet";
  case ProtocolError::UnexpectedMessage:
    return "unexpected message";
  case ProtocolError::NoSuchSession:
    return "no such session";
  case ProtocolError::NoSuchFile:
    return "no such file";
  case ProtocolError::BadChunkCrc:
    return "bad chunk crc";
  case ProtocolError::FileTooLarge:
    return "file too large";
  case ProtocolError::HeaderRejected:
    return "header rejected";
  case ProtocolError::BodyRejected:
    return "body rejected";
  case ProtocolError::Busy:
    return "busy";
  }
  return "?";
}

const char *to_string(Ftl0Type t) {
  switch (t) {
  case Ftl0Type::Data:
    return "DATA";
  case Ftl0Type::DataEnd:
    return "DATA_END";
  case Ftl0Type::UploadCmd:
    return "UPLOAD_CMD";
  case Ftl0Type::UlGoResp:
    return "UL_GO_RESP";
  case Ftl0Type::UlErrorResp:
    return "UL_ERROR_RESP";
  case Ftl0Type::UlAckResp:
    return "UL_ACK_RESP";
  case Ftl0Type::UlNakResp:
    return "UL_NAK_RESP";
  case Ftl0Type::HoleList:
    return "HOLE_LIST";
  case Ftl0Type::DlRequest:
    return "DL_REQUEST";
  case Ftl0Type::DlAck:
    return "DL_ACK";
  case Ftl0Type::DlDone:
    return "DL_DONE";
  }
  return "?";
}

static void put_holes(std::vector<uint8_t> &out,
                      const std::vector<ByteRange> &holes) {
  put_le16(out, (uint16_t)holes.size());
  for (const auto &h : holes) {
    put_le32(out, h.start);
    put_le32(out, h.end);
  }
}

static bool get_holes(const uint8_t *p, size_t n,
                      std::vector<ByteRange> &out) {
  if (n < 2)
    return false;
  size_t count = get_le16(p);
  if (n != 2 + count * 8)
    return false;
  out.clear();
  out.reserve(count);
  for (size_t i = 0; i < count; i++) {
    ByteRange r{get_le32(p + 2 + i * 8), get_le32(p + 6 + i * 8)};
    if (r.start >= r.end)
      return false;
    out.push_back(r);
  }
  return true;
}

bool encode_ftl0(const Ftl0Packet &p, std::vector<uint8_t> &out) {
  std::vector<uint8_t> body;
  switch (p.type) {
  case Ftl0Type::Data:
    put_le32(body, p.file_number);
    put_le32(body, p.offset);
    put_le16(body, crc16(p.data.data(), p.data.size()));
    body.insert(body.end(), p.data.begin(), p.data.end());
    break;
  case Ftl0Type::DataEnd:
  case Ftl0Type::UlAckResp:
  case Ftl0Type::DlAck:
    put_le32(body, p.file_number);
    break;
  case Ftl0Type::UploadCmd:
  case Ftl0Type::DlDone:
    put_le32(body, p.file_number);
    put_le32(body, p.length);
    break;
  case Ftl0Type::UlGoResp:
  case Ftl0Type::HoleList:
    put_le32(body, p.file_number);
    put_holes(body, p.holes);
    break;
  case Ftl0Type::UlErrorResp:
    body.push_back((uint8_t)p.error);
    break;
  case Ftl0Type::UlNakResp:
    put_le32(body, p.file_number);
    body.push_back((uint8_t)p.error);
    break;
  case Ftl0Type::DlRequest:
    put_le32(body, p.file_number);
    body.push_back(p.flags);
    put_holes(body, p.holes);
    break;
  }
  if (body.size() > kFtl0MaxBody)
    return false;
  out.clear();
  out.reserve(body.size() + 2);
  out.push_back((uint8_t)(body.size() & 0xFF));
  out.push_back((uint8_t)(((body.size() >> 8) << 5) | (uint8_t)p.type));
  out.insert(out.end(), body.begin(), body.end());
  return true;
}

ProtocolError decode_ftl0(const uint8_t *data, size_t len, Ftl0Packet &out) {
  if (len < 2)
    return ProtocolError::Malformed;
  size_t body_len = data[0] | ((size_t)(data[1] >> 5) << 8);
  uint8_t type = data[1] & 0x1F;
  if (body_len != len - 2)
    return ProtocolError::Malformed;
  const uint8_t *p = data + 2;
  size_t n = body_len;
  out = Ftl0Packet{};
  out.type = (Ftl0Type)type;
  switch (out.type) {
  case Ftl0Type::Data:
    if (n < 10)
      return ProtocolError::Malformed;
    out.file_number = get_le32(p);
    out.offset = get_le32(p + 4);
    out.data.assign(p + 10, p + n);
    if (crc16(out.data.data(), out.data.size()) != get_le16(p + 8))
      return ProtocolError::BadChunkCrc;
    return ProtocolError::Ok;
  case Ftl0Type::DataEnd:
  case Ftl0Type::UlAckResp:
  case Ftl0Type::DlAck:
    if (n != 4)
      return ProtocolError::Malformed;
    out.file_number = get_le32(p);
    return ProtocolError::Ok;
  case Ftl0Type::UploadCmd:
  case Ftl0Type::DlDone:
    if (n != 8)
      return ProtocolError::Malformed;
    out.file_number = get_le32(p);
    out.length = get_le32(p + 4);
    return ProtocolError::Ok;
  case Ftl0Type::UlGoResp:
  case Ftl0Type::HoleList:
    if (n < 4 || !get_holes(p + 4, n - 4, out.holes))
      return ProtocolError::Malformed;
    out.file_number = get_le32(p);
    return ProtocolError::Ok;
  case Ftl0Type::UlErrorResp:
    if (n != 1)
      return ProtocolError::Malformed;
    out.error = (ProtocolError)p[0];
    return ProtocolError::Ok;
  case Ftl0Type::UlNakResp:
    if (n != 5)
      return ProtocolError::Malformed;
    out.file_number = get_le32(p);
    out.error = (ProtocolError)p[4];
    return ProtocolError::Ok;
  case Ftl0Type::DlRequest:
    if (n < 5 || !get_holes(p + 5, n - 5, out.holes))
      return ProtocolError::Malformed;
    out.file_number = get_le32(p);
    out.flags = p[4];
    return ProtocolError::Ok;
  }
  return ProtocolError::Malformed;
}

} // namespace pacsat
