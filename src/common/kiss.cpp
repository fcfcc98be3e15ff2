#include "kiss.hpp"
#include "logging.hpp"

namespace pacsat {

void KissCodec::reset() {
  buffer_.clear();
  in_frame_ = false;
  escape_ = false;
}

void KissCodec::fail(FrameError e, std::vector<LinkEvent> &out) {
  LinkEvent ev;
  ev.kind = LinkEvent::Kind::Error;
  ev.error = e;
  out.push_back(std::move(ev));
  // drop everything up to the next FEND
  buffer_.clear();
  in_frame_ = false;
  escape_ = false;
}

void KissCodec::feed(const uint8_t *data, size_t len,
                     std::vector<LinkEvent> &out) {
  for (size_t i = 0; i < len; ++i) {
    uint8_t byte = data[i];
    if (byte == KISS_FEND) {
      // a frame cut short after FESC is damaged; the FEND opens the next one
      if (in_frame_ && escape_)
        fail(FrameError::Desync, out);
      else if (in_frame_ && !buffer_.empty())
        finish_frame(out);
      buffer_.clear();
      escape_ = false;
      in_frame_ = true;
      continue;
    }
    if (!in_frame_)
      continue;
    if (escape_) {
      escape_ = false;
      if (byte == KISS_TFEND)
        byte = KISS_FEND;
      else if (byte == KISS_TFESC)
        byte = KISS_FESC;
      else {
        fail(FrameError::Desync, out);
        continue;
      }
    } else if (byte == KISS_FESC) {
      escape_ = true;
      continue;
    }
    if (buffer_.size() >= opt_.max_frame) {
      fail(FrameError::Oversize, out);
      continue;
    }
    buffer_.push_back(byte);
  }
}

void KissCodec::finish_frame(std::vector<LinkEvent> &out) {
  uint8_t cmd = buffer_[0];
  if (cmd == (uint8_t)KissCommand::Return)
    return;
  size_t end = buffer_.size();
  if (opt_.extended && opt_.checksum) {
    if (end < 2) {
      fail(FrameError::TooShort, out);
      return;
    }
    uint8_t x = 0;
    for (size_t i = 0; i + 1 < end; i++)
      x ^= buffer_[i];
    if (x != buffer_[end - 1]) {
      fail(FrameError::BadChecksum, out);
      return;
    }
    end--;
  }

  LinkEvent ev;
  ev.port = (uint8_t)(cmd >> 4);
  size_t off = 1;
  switch (cmd & 0x0F) {
  case (uint8_t)KissCommand::DataFrame:
    break;
  case (uint8_t)KissCommand::AckMode:
    if (!opt_.extended) {
      fail(FrameError::UnknownCommand, out);
      return;
    }
    if (end < 3) {
      fail(FrameError::TooShort, out);
      return;
    }
    ev.ack_mode = true;
    ev.ack_id = (uint16_t)((buffer_[1] << 8) | buffer_[2]);
    off = 3;
    break;
  case (uint8_t)KissCommand::Poll:
    if (!opt_.extended) {
      fail(FrameError::UnknownCommand, out);
      return;
    }
    ev.kind = LinkEvent::Kind::Poll;
    out.push_back(std::move(ev));
    return;
  case (uint8_t)KissCommand::TxDelay:
  case (uint8_t)KissCommand::Persistence:
  case (uint8_t)KissCommand::SlotTime:
  case (uint8_t)KissCommand::TxTail:
  case (uint8_t)KissCommand::FullDuplex:
  case (uint8_t)KissCommand::SetHardware:
    Logger::instance().log(LogLevel::DEBUG, "kiss: ignoring command 0x%02x",
                           (unsigned)cmd);
    return;
  default:
    fail(FrameError::UnknownCommand, out);
    return;
  }

  FrameError fe = decode_ax25(buffer_.data() + off, end - off, opt_.fcs,
                              ev.frame, opt_.max_info);
  if (fe != FrameError::Ok) {
    fail(fe, out);
    return;
  }
  out.push_back(std::move(ev));
}

std::vector<uint8_t> KissCodec::wrap(const std::vector<uint8_t> &raw) const {
  std::vector<uint8_t> output;
  output.reserve(raw.size() + raw.size() / 16 + 4);
  output.push_back(KISS_FEND);
  uint8_t x = 0;
  auto put = [&output](uint8_t byte) {
    if (byte == KISS_FEND) {
      output.push_back(KISS_FESC);
      output.push_back(KISS_TFEND);
    } else if (byte == KISS_FESC) {
      output.push_back(KISS_FESC);
      output.push_back(KISS_TFESC);
    } else {
      output.push_back(byte);
    }
  };
  for (uint8_t byte : raw) {
    x ^= byte;
    put(byte);
  }
  if (opt_.extended && opt_.checksum)
    put(x);
  output.push_back(KISS_FEND);
  return output;
}

FrameError KissCodec::encode(const Ax25Frame &f, std::vector<uint8_t> &out) {
  std::vector<uint8_t> raw;
  FrameError fe = encode_ax25(f, opt_.fcs, raw, opt_.max_info);
  if (fe != FrameError::Ok)
    return fe;
  raw.insert(raw.begin(), (uint8_t)((opt_.port << 4) |
                                    (uint8_t)KissCommand::DataFrame));
  out = wrap(raw);
  return FrameError::Ok;
}

std::vector<uint8_t> KissCodec::encode_command(KissCommand cmd,
                                               uint8_t value) const {
  std::vector<uint8_t> raw;
  if (cmd == KissCommand::Return) {
    raw.push_back(0xFF);
  } else {
    raw.push_back((uint8_t)((opt_.port << 4) | ((uint8_t)cmd & 0x0F)));
    raw.push_back(value);
  }
  return wrap(raw);
}

std::vector<uint8_t> KissCodec::encode_poll() const {
  std::vector<uint8_t> raw{
      (uint8_t)((opt_.port << 4) | (uint8_t)KissCommand::Poll)};
  return wrap(raw);
}

} // namespace pacsat
