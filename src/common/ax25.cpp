#include "ax25.hpp"
#include "protocol.hpp"
#include "util.hpp"

namespace pacsat {

static constexpr size_t kAddrLen = 7;

const char *to_string(FrameError e) {
  switch (e) {
  case FrameError::Ok:
    return "ok";
  case FrameError::Desync:
    return "desync";
  case FrameError::BadFcs:
    return "bad fcs";
  case FrameError::BadChecksum:
    return "bad checksum";
  case FrameError::MalformedAddress:
    return "malformed address";
  case FrameError::TooShort:
    return "too short";
  case FrameError::Oversize:
    return "oversize";
  default:
    return "unknown command";
  }
}

static bool valid_call(const std::string &call) {
  if (call.empty() || call.size() > 6)
    return false;
  for (char c : call) {
    if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')))
      return false;
  }
  return true;
}

std::string Ax25Address::to_string() const {
  if (ssid == 0)
    return callsign;
  return callsign + "-" + std::to_string((unsigned)ssid);
}

bool parse_address(const std::string &text, Ax25Address &out) {
  std::string call = text;
  int ssid = 0;
  auto dash = text.find('-');
  if (dash != std::string::npos) {
    call = text.substr(0, dash);
    std::string s = text.substr(dash + 1);
    if (s.empty() || s.size() > 2)
      return false;
    for (char c : s)
      if (c < '0' || c > '9')
        return false;
    ssid = std::stoi(s);
    if (ssid > 15)
      return false;
  }
  call = to_upper(call);
  if (!valid_call(call))
    return false;
  out.callsign = call;
  out.ssid = (uint8_t)ssid;
  out.flag = false;
  return true;
}

Ax25Frame Ax25Frame::ui(const Ax25Address &dst, const Ax25Address &src,
                        uint8_t pid, std::vector<uint8_t> info) {
  Ax25Frame f;
  f.destination = dst;
  f.source = src;
  f.control = kUiControl;
  f.pid = pid;
  f.info = std::move(info);
  return f;
}

static bool put_address(std::vector<uint8_t> &out, const Ax25Address &a,
                        bool last) {
  if (!valid_call(a.callsign) || a.ssid > 15)
    return false;
  for (size_t i = 0; i < 6; i++) {
    char c = i < a.callsign.size() ? a.callsign[i] : ' ';
    out.push_back((uint8_t)(c << 1));
  }
  uint8_t ssid = (uint8_t)(0x60 | (a.ssid << 1));
  if (a.flag)
    ssid |= 0x80;
  if (last)
    ssid |= 0x01;
  out.push_back(ssid);
  return true;
}

static bool get_address(const uint8_t *p, Ax25Address &a, bool &last) {
  std::string call;
  bool padding = false;
  for (size_t i = 0; i < 6; i++) {
    if (p[i] & 0x01)
      return false;
    char c = (char)(p[i] >> 1);
    if (c == ' ') {
      padding = true;
      continue;
    }
    if (padding)
      return false;
    call.push_back(c);
  }
  if (!valid_call(call))
    return false;
  a.callsign = call;
  a.ssid = (uint8_t)((p[6] >> 1) & 0x0F);
  a.flag = (p[6] & 0x80) != 0;
  last = (p[6] & 0x01) != 0;
  return true;
}

FrameError encode_ax25(const Ax25Frame &f, bool with_fcs,
                       std::vector<uint8_t> &out, size_t max_info) {
  if (f.digipeaters.size() > kAx25MaxDigipeaters)
    return FrameError::MalformedAddress;
  if (f.info.size() > max_info)
    return FrameError::Oversize;
  out.clear();
  out.reserve(kAddrLen * (2 + f.digipeaters.size()) + 2 + f.info.size() + 2);
  Ax25Address dst = f.destination;
  Ax25Address src = f.source;
  // v2 command frame: C bit set in destination, clear in source
  dst.flag = true;
  src.flag = false;
  if (!put_address(out, dst, false) ||
      !put_address(out, src, f.digipeaters.empty()))
    return FrameError::MalformedAddress;
  for (size_t i = 0; i < f.digipeaters.size(); i++) {
    if (!put_address(out, f.digipeaters[i], i + 1 == f.digipeaters.size()))
      return FrameError::MalformedAddress;
  }
  out.push_back(f.control);
  if (f.has_pid())
    out.push_back(f.pid);
  out.insert(out.end(), f.info.begin(), f.info.end());
  if (with_fcs)
    put_le16(out, crc16(out.data(), out.size()));
  return FrameError::Ok;
}

FrameError decode_ax25(const uint8_t *data, size_t len, bool with_fcs,
                       Ax25Frame &out, size_t max_info) {
  size_t body = len;
  if (with_fcs) {
    if (len < 2)
      return FrameError::TooShort;
    body = len - 2;
  }
  if (body < 2 * kAddrLen + 1)
    return FrameError::TooShort;
  if (with_fcs && crc16(data, body) != get_le16(data + body))
    return FrameError::BadFcs;

  Ax25Frame f;
  bool last = false;
  if (!get_address(data, f.destination, last) || last)
    return FrameError::MalformedAddress;
  if (!get_address(data + kAddrLen, f.source, last))
    return FrameError::MalformedAddress;
  size_t off = 2 * kAddrLen;
  while (!last) {
    if (f.digipeaters.size() == kAx25MaxDigipeaters)
      return FrameError::MalformedAddress;
    if (body < off + kAddrLen + 1)
      return FrameError::TooShort;
    Ax25Address digi;
    if (!get_address(data + off, digi, last))
      return FrameError::MalformedAddress;
    f.digipeaters.push_back(digi);
    off += kAddrLen;
  }
  f.control = data[off++];
  if (f.has_pid()) {
    if (off >= body)
      return FrameError::TooShort;
    f.pid = data[off++];
  } else {
    f.pid = 0;
  }
  if (body - off > max_info)
    return FrameError::Oversize;
  f.info.assign(data + off, data + body);
  out = std::move(f);
  return FrameError::Ok;
}

} // namespace pacsat
