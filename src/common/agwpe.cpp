#include "agwpe.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <cstring>

namespace pacsat {

static void put_call(uint8_t *dst, const std::string &call) {
  std::memset(dst, 0, 10);
  std::memcpy(dst, call.data(), std::min<size_t>(call.size(), 10));
}

static std::string get_call(const uint8_t *src) {
  size_t n = 0;
  while (n < 10 && src[n] != 0)
    n++;
  std::string s((const char *)src, n);
  while (!s.empty() && s.back() == ' ')
    s.pop_back();
  return s;
}

std::vector<uint8_t> encode_agwpe(const AgwpeHeader &h,
                                  const std::vector<uint8_t> &data) {
  std::vector<uint8_t> out(kAgwpeHeaderLen, 0);
  out[0] = h.port;
  out[4] = (uint8_t)h.data_kind;
  out[6] = h.pid;
  put_call(out.data() + 8, h.call_from);
  put_call(out.data() + 18, h.call_to);
  uint32_t n = (uint32_t)data.size();
  for (int i = 0; i < 4; i++) {
    out[28 + i] = (uint8_t)(n >> (8 * i));
    out[32 + i] = (uint8_t)(h.user >> (8 * i));
  }
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

void decode_agwpe_header(const uint8_t *p, AgwpeHeader &out) {
  out.port = p[0];
  out.data_kind = (char)p[4];
  out.pid = p[6];
  out.call_from = get_call(p + 8);
  out.call_to = get_call(p + 18);
  out.data_len = get_le32(p + 28);
  out.user = get_le32(p + 32);
}

void AgwpeCodec::feed(const uint8_t *data, size_t len,
                      std::vector<LinkEvent> &out) {
  inbuf_.insert(inbuf_.end(), data, data + len);
  size_t off = 0;
  while (inbuf_.size() - off >= kAgwpeHeaderLen) {
    AgwpeHeader h;
    decode_agwpe_header(inbuf_.data() + off, h);
    if (h.data_len > opt_.max_data) {
      LinkEvent ev;
      ev.kind = LinkEvent::Kind::Error;
      ev.error = FrameError::Oversize;
      out.push_back(std::move(ev));
      // length field is untrustworthy; nothing after it can be realigned
      inbuf_.clear();
      return;
    }
    size_t need = kAgwpeHeaderLen + h.data_len;
    if (inbuf_.size() - off < need)
      break;
    const uint8_t *payload = inbuf_.data() + off + kAgwpeHeaderLen;
    if (h.data_kind == 'K') {
      LinkEvent ev;
      ev.port = h.port;
      FrameError fe = FrameError::TooShort;
      if (h.data_len >= 1)
        fe = decode_ax25(payload + 1, h.data_len - 1, false, ev.frame,
                         opt_.max_info);
      if (fe != FrameError::Ok) {
        ev.kind = LinkEvent::Kind::Error;
        ev.error = fe;
      }
      out.push_back(std::move(ev));
    } else {
      Logger::instance().log(LogLevel::DEBUG,
                             "agwpe: ignoring '%c' frame from %s",
                             h.data_kind ? h.data_kind : '?',
                             h.call_from.c_str());
    }
    off += need;
  }
  if (off > 0)
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off);
}

FrameError AgwpeCodec::encode(const Ax25Frame &f, std::vector<uint8_t> &out) {
  std::vector<uint8_t> raw;
  FrameError fe = encode_ax25(f, false, raw, opt_.max_info);
  if (fe != FrameError::Ok)
    return fe;
  raw.insert(raw.begin(), (uint8_t)(opt_.port << 4));
  AgwpeHeader h;
  h.port = opt_.port;
  h.data_kind = 'K';
  h.call_from = f.source.to_string();
  h.call_to = f.destination.to_string();
  out = encode_agwpe(h, raw);
  return FrameError::Ok;
}

std::vector<uint8_t> AgwpeCodec::login() {
  AgwpeHeader reg;
  reg.port = opt_.port;
  reg.data_kind = 'X';
  reg.call_from = opt_.callsign;
  std::vector<uint8_t> out = encode_agwpe(reg, {});
  AgwpeHeader raw;
  raw.port = opt_.port;
  raw.data_kind = 'k';
  std::vector<uint8_t> k = encode_agwpe(raw, {});
  out.insert(out.end(), k.begin(), k.end());
  return out;
}

} // namespace pacsat
