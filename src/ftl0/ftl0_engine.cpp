#include "ftl0_engine.hpp"
#include "logging.hpp"
#include <algorithm>
#include <ctime>

namespace pacsat {

static constexpr size_t kMaxReportedHoles = (kFtl0MaxBody - 6) / 8;

Ftl0Engine::Ftl0Engine(const Ftl0Config &cfg, FileStore &store,
                       BroadcastScheduler &scheduler, FrameSink &sink)
    : cfg_(cfg), store_(store), scheduler_(scheduler), sink_(sink) {
  if (cfg_.chunk_size == 0)
    cfg_.chunk_size = 1;
  if (cfg_.header_segment == 0)
    cfg_.header_segment = 1;
  if (cfg_.burst == 0)
    cfg_.burst = 1;
}

bool Ftl0Engine::upload_state(const std::string &remote, uint32_t file_number,
                              UploadState &out) const {
  auto it = uploads_.find(SessionKey(remote, file_number));
  if (it == uploads_.end())
    return false;
  out = it->second.state;
  return true;
}

bool Ftl0Engine::download_state(const std::string &remote,
                                uint32_t file_number,
                                DownloadState &out) const {
  auto it = downloads_.find(SessionKey(remote, file_number));
  if (it == downloads_.end())
    return false;
  out = it->second.state;
  return true;
}

// ---- outbound -------------------------------------------------------------

void Ftl0Engine::send_ui(const Ax25Address &to, uint8_t pid,
                         std::vector<uint8_t> info) {
  sink_.send(Ax25Frame::ui(to, cfg_.callsign, pid, std::move(info)));
}

void Ftl0Engine::reply(const Ax25Address &to, const Ftl0Packet &p) {
  std::vector<uint8_t> bytes;
  if (!encode_ftl0(p, bytes)) {
    Logger::instance().log(LogLevel::ERROR, "ftl0: %s to %s does not fit",
                           to_string(p.type), to.to_string().c_str());
    return;
  }
  send_ui(to, kPidFtl0, std::move(bytes));
}

void Ftl0Engine::reply_error(const Ax25Address &to, ProtocolError e) {
  Ftl0Packet p;
  p.type = Ftl0Type::UlErrorResp;
  p.error = e;
  reply(to, p);
}

void Ftl0Engine::reply_nak(const Ax25Address &to, uint32_t file_number,
                           ProtocolError e) {
  Ftl0Packet p;
  p.type = Ftl0Type::UlNakResp;
  p.file_number = file_number;
  p.error = e;
  reply(to, p);
}

void Ftl0Engine::reply_holes(const Ax25Address &to, Ftl0Type type,
                             uint32_t file_number, const HoleList &holes) {
  Ftl0Packet p;
  p.type = type;
  p.file_number = file_number;
  const auto &r = holes.ranges();
  p.holes.assign(r.begin(),
                 r.begin() + std::min(r.size(), kMaxReportedHoles));
  reply(to, p);
}

bool Ftl0Engine::store_ok(StoreError e) {
  if (e == StoreError::Ok)
    return true;
  if (e == StoreError::Exhausted) {
    fatal_ = e;
    Logger::instance().log(LogLevel::ERROR, "ftl0: store exhausted");
  } else {
    Logger::instance().log(LogLevel::WARN, "ftl0: store error: %s",
                           to_string(e));
  }
  return false;
}

// ---- inbound --------------------------------------------------------------

void Ftl0Engine::handle_frame(const Ax25Frame &f, SteadyTime now) {
  if (!f.is_ui()) {
    Logger::instance().log(LogLevel::DEBUG,
                           "ftl0: ignoring connected-mode frame from %s",
                           f.source.to_string().c_str());
    return;
  }
  if (f.destination != cfg_.callsign)
    return;
  if (f.pid != kPidFtl0) {
    Logger::instance().log(LogLevel::DEBUG, "ftl0: ignoring pid 0x%02x from %s",
                           f.pid, f.source.to_string().c_str());
    return;
  }
  Ax25Address remote = f.source;
  remote.flag = false;

  Ftl0Packet p;
  ProtocolError err = decode_ftl0(f.info.data(), f.info.size(), p);
  if (err == ProtocolError::BadChunkCrc) {
    Logger::instance().log(LogLevel::WARN,
                           "ftl0: chunk crc failure from %s (file %u offset "
                           "%u), discarded",
                           remote.to_string().c_str(), p.file_number,
                           p.offset);
    return;
  }
  if (err != ProtocolError::Ok) {
    Logger::instance().log(LogLevel::WARN, "ftl0: %s from %s",
                           to_string(err), remote.to_string().c_str());
    reply_error(remote, err);
    return;
  }
  Logger::instance().log(LogLevel::TRACE, "ftl0: %s file %u from %s",
                         to_string(p.type), p.file_number,
                         remote.to_string().c_str());

  switch (p.type) {
  case Ftl0Type::UploadCmd:
    on_upload_cmd(remote, p, now);
    break;
  case Ftl0Type::Data:
    on_data(remote, p, now);
    break;
  case Ftl0Type::DataEnd:
    on_data_end(remote, p, now);
    break;
  case Ftl0Type::DlRequest:
    on_dl_request(remote, p, now);
    break;
  case Ftl0Type::DlAck:
    on_dl_ack(remote, p);
    break;
  default: {
    // station-to-client packets have no business arriving here
    SessionKey key(remote.to_string(), p.file_number);
    auto up = uploads_.find(key);
    if (up != uploads_.end())
      drop_upload(up);
    downloads_.erase(key);
    Logger::instance().log(LogLevel::WARN, "ftl0: unexpected %s from %s",
                           to_string(p.type), remote.to_string().c_str());
    reply_error(remote, ProtocolError::UnexpectedMessage);
    break;
  }
  }
}

void Ftl0Engine::on_upload_cmd(const Ax25Address &remote, const Ftl0Packet &p,
                               SteadyTime now) {
  if (p.file_number != 0) {
    auto it = uploads_.find(SessionKey(remote.to_string(), p.file_number));
    if (it == uploads_.end()) {
      Logger::instance().log(LogLevel::WARN,
                             "ftl0: %s asked to continue unknown upload %u",
                             remote.to_string().c_str(), p.file_number);
      reply_error(remote, ProtocolError::NoSuchSession);
      return;
    }
    HoleList holes;
    if (!store_ok(store_.holes(it->second.handle, holes))) {
      uploads_.erase(it);
      reply_error(remote, ProtocolError::NoSuchSession);
      return;
    }
    it->second.last_activity = now;
    reply_holes(remote, Ftl0Type::UlGoResp, p.file_number, holes);
    return;
  }

  if (p.length == 0 || p.length > cfg_.max_upload) {
    Logger::instance().log(LogLevel::WARN,
                           "ftl0: upload of %u bytes from %s refused",
                           p.length, remote.to_string().c_str());
    reply_error(remote, ProtocolError::FileTooLarge);
    return;
  }
  if (session_count() >= cfg_.max_sessions) {
    reply_error(remote, ProtocolError::Busy);
    return;
  }

  uint32_t number = 0;
  if (!store_ok(store_.allocate_file_number(number))) {
    reply_error(remote, ProtocolError::Busy);
    return;
  }
  Pfh stub;
  stub.file_number = number;
  stub.source = remote.callsign;
  stub.upload_time = (uint32_t)std::time(nullptr);
  TransferHandle h = 0;
  if (!store_ok(store_.begin_receive(stub, p.length, h))) {
    reply_error(remote, ProtocolError::Busy);
    return;
  }

  Upload u;
  u.remote = remote;
  u.file_number = number;
  u.length = p.length;
  u.handle = h;
  u.last_activity = now;
  u.last_report = now;
  uploads_[SessionKey(remote.to_string(), number)] = u;
  Logger::instance().log(LogLevel::INFO,
                         "ftl0: upload %u from %s, %u bytes",
                         number, remote.to_string().c_str(), p.length);
  reply_holes(remote, Ftl0Type::UlGoResp, number, HoleList(p.length));
}

void Ftl0Engine::drop_upload(std::map<SessionKey, Upload>::iterator it) {
  StoreError e = store_.abandon(it->second.handle);
  if (e != StoreError::NotFound)
    store_ok(e);
  uploads_.erase(it);
}

void Ftl0Engine::on_data(const Ax25Address &remote, const Ftl0Packet &p,
                         SteadyTime now) {
  SessionKey key(remote.to_string(), p.file_number);
  auto it = uploads_.find(key);
  if (it == uploads_.end()) {
    if (completed_.count(key))
      return; // late duplicate after the ACK
    reply_error(remote, ProtocolError::NoSuchSession);
    return;
  }
  Upload &u = it->second;
  u.last_activity = now;

  ChunkOutcome oc;
  StoreError err = store_.write_chunk(u.handle, p.offset, p.data.data(),
                                      p.data.size(), &oc);
  if (err == StoreError::Overlap) {
    Logger::instance().log(LogLevel::WARN,
                           "ftl0: %s wrote past end of upload %u (%u+%zu)",
                           key.first.c_str(), p.file_number, p.offset,
                           p.data.size());
    reply_error(remote, ProtocolError::Malformed);
    return;
  }
  if (err == StoreError::Rejected ||
      (err == StoreError::Ok && oc.state == FileState::Active)) {
    finish_upload(it, err, oc, now);
    return;
  }
  if (err != StoreError::Ok) {
    store_ok(err);
    drop_upload(it);
    reply_error(remote, ProtocolError::Busy);
    return;
  }
  if (oc.new_bytes > 0)
    u.dirty = true;
  if (u.state == UploadState::ReceivingHeader && oc.new_bytes > 0) {
    std::vector<uint8_t> prefix;
    if (!store_ok(store_.pending_prefix(u.handle, prefix, kPfhMaxHeader)))
      return;
    PfhView view;
    HeaderError he = parse_pfh(prefix.data(), prefix.size(), view);
    if (he == HeaderError::Truncated)
      return;
    if (he == HeaderError::Ok &&
        view.header_len + (uint64_t)view.header.file_size == u.length) {
      u.state = UploadState::ReceivingBody;
      Logger::instance().log(LogLevel::DEBUG,
                             "ftl0: upload %u header ok (%s, %u bytes)",
                             u.file_number, view.header.filename().c_str(),
                             view.header.file_size);
      return;
    }
    if (he == HeaderError::Ok)
      Logger::instance().log(LogLevel::WARN,
                             "ftl0: upload %u from %s declares %u bytes, "
                             "header says %zu",
                             u.file_number, key.first.c_str(), u.length,
                             (size_t)(view.header_len + view.header.file_size));
    else
      Logger::instance().log(LogLevel::WARN,
                             "ftl0: upload %u from %s header rejected: %s",
                             u.file_number, key.first.c_str(), to_string(he));
    reply_nak(remote, u.file_number, ProtocolError::HeaderRejected);
    drop_upload(it);
  }
}

void Ftl0Engine::finish_upload(std::map<SessionKey, Upload>::iterator it,
                               StoreError err, const ChunkOutcome &oc,
                               SteadyTime now) {
  Upload &u = it->second;
  if (err == StoreError::Ok) {
    Ftl0Packet ack;
    ack.type = Ftl0Type::UlAckResp;
    ack.file_number = u.file_number;
    reply(u.remote, ack);
    Logger::instance().log(LogLevel::INFO, "ftl0: upload %u from %s stored",
                           u.file_number, it->first.first.c_str());
    completed_[it->first] = now;
  } else {
    ProtocolError why = oc.header_error != HeaderError::Ok
                            ? ProtocolError::HeaderRejected
                            : ProtocolError::BodyRejected;
    Logger::instance().log(LogLevel::WARN, "ftl0: upload %u from %s: %s",
                           u.file_number, it->first.first.c_str(),
                           to_string(why));
    reply_nak(u.remote, u.file_number, why);
  }
  uploads_.erase(it);
}

void Ftl0Engine::on_data_end(const Ax25Address &remote, const Ftl0Packet &p,
                             SteadyTime now) {
  SessionKey key(remote.to_string(), p.file_number);
  if (completed_.count(key)) {
    Ftl0Packet ack;
    ack.type = Ftl0Type::UlAckResp;
    ack.file_number = p.file_number;
    reply(remote, ack);
    return;
  }
  auto it = uploads_.find(key);
  if (it == uploads_.end()) {
    reply_error(remote, ProtocolError::NoSuchSession);
    return;
  }
  HoleList holes;
  if (!store_ok(store_.holes(it->second.handle, holes))) {
    uploads_.erase(it);
    reply_error(remote, ProtocolError::NoSuchSession);
    return;
  }
  it->second.dirty = false;
  it->second.last_report = now;
  it->second.last_activity = now;
  reply_holes(remote, Ftl0Type::HoleList, p.file_number, holes);
}

void Ftl0Engine::on_dl_request(const Ax25Address &remote, const Ftl0Packet &p,
                               SteadyTime now) {
  FileMetadata meta;
  if (store_.metadata(p.file_number, meta) != StoreError::Ok) {
    Logger::instance().log(LogLevel::INFO,
                           "ftl0: %s requested missing file %u",
                           remote.to_string().c_str(), p.file_number);
    reply_error(remote, ProtocolError::NoSuchFile);
    return;
  }

  if (p.broadcast()) {
    if (!scheduler_.enqueue_ranges(p.file_number, p.holes,
                                   cfg_.broadcast_priority))
      reply_error(remote, ProtocolError::NoSuchFile);
    return;
  }

  HoleList ranges;
  for (const auto &r : p.holes)
    ranges.add(r.start, std::min(r.end, meta.size));
  if (p.holes.empty())
    ranges = HoleList(meta.size);
  else if (ranges.empty()) {
    reply_error(remote, ProtocolError::Malformed);
    return;
  }

  SessionKey key(remote.to_string(), p.file_number);
  auto it = downloads_.find(key);
  if (it != downloads_.end()) {
    Download &d = it->second;
    for (const auto &r : ranges.ranges())
      d.ranges.add(r.start, r.end);
    if (d.state == DownloadState::AwaitingAck)
      d.state = DownloadState::Retransmit;
    d.last_activity = now;
    Logger::instance().log(LogLevel::DEBUG,
                           "ftl0: %s re-requested %zu range(s) of %u",
                           key.first.c_str(), ranges.ranges().size(),
                           p.file_number);
    return;
  }
  if (session_count() >= cfg_.max_sessions) {
    reply_error(remote, ProtocolError::Busy);
    return;
  }

  Download d;
  d.remote = remote;
  d.file_number = p.file_number;
  d.file_size = meta.size;
  d.ranges = ranges;
  d.last_activity = now;
  if (!store_ok(store_.header_bytes(p.file_number, d.header))) {
    reply_error(remote, ProtocolError::NoSuchFile);
    return;
  }
  downloads_[key] = std::move(d);
  Logger::instance().log(LogLevel::INFO, "ftl0: download %u (%s) to %s",
                         p.file_number, meta.filename.c_str(),
                         key.first.c_str());
}

void Ftl0Engine::on_dl_ack(const Ax25Address &remote, const Ftl0Packet &p) {
  auto it = downloads_.find(SessionKey(remote.to_string(), p.file_number));
  if (it == downloads_.end()) {
    reply_error(remote, ProtocolError::NoSuchSession);
    return;
  }
  if (it->second.state != DownloadState::AwaitingAck) {
    Logger::instance().log(LogLevel::WARN,
                           "ftl0: early DL_ACK for %u from %s, session reset",
                           p.file_number, remote.to_string().c_str());
    downloads_.erase(it);
    reply_error(remote, ProtocolError::UnexpectedMessage);
    return;
  }
  downloads_.erase(it);
  StoreError e = store_.record_download(p.file_number);
  if (e != StoreError::NotFound)
    store_ok(e);
  Logger::instance().log(LogLevel::INFO, "ftl0: download %u by %s done",
                         p.file_number, remote.to_string().c_str());
}

// ---- timers ---------------------------------------------------------------

bool Ftl0Engine::pump_download(Download &d) {
  if (d.state == DownloadState::Retransmit)
    d.state = DownloadState::SendingChunks;
  for (size_t budget = cfg_.burst; budget > 0; budget--) {
    if (d.state == DownloadState::SendingDirectory) {
      size_t seg =
          std::min(cfg_.header_segment, d.header.size() - d.header_sent);
      DirectoryEntry e;
      e.file_number = d.file_number;
      e.offset = d.header_sent;
      e.header.assign(d.header.begin() + d.header_sent,
                      d.header.begin() + d.header_sent + seg);
      d.header_sent += (uint32_t)seg;
      if (d.header_sent == d.header.size()) {
        e.flags |= BF_LAST;
        d.state = DownloadState::SendingChunks;
      }
      send_ui(d.remote, kPidDirectory, encode_directory_entry(e));
    } else if (d.state == DownloadState::SendingChunks) {
      if (d.ranges.empty()) {
        Ftl0Packet done;
        done.type = Ftl0Type::DlDone;
        done.file_number = d.file_number;
        done.length = d.file_size;
        reply(d.remote, done);
        d.state = DownloadState::AwaitingAck;
        break;
      }
      ByteRange front = d.ranges.ranges().front();
      uint32_t len = (uint32_t)std::min<size_t>(cfg_.chunk_size, front.length());
      Pfh pfh;
      FileChunk c;
      if (!store_ok(store_.download(d.file_number, front.start, len, pfh,
                                    c.data))) {
        reply_error(d.remote, ProtocolError::NoSuchFile);
        return false;
      }
      c.file_number = d.file_number;
      c.file_type = pfh.file_type;
      c.offset = front.start;
      if (front.start + c.data.size() >= pfh.file_size)
        c.flags |= BF_LAST;
      d.ranges.fill(front.start, front.start + len);
      send_ui(d.remote, kPidFileChunk, encode_file_chunk(c));
    } else {
      break;
    }
  }
  return true;
}

void Ftl0Engine::pump(SteadyTime now) {
  for (auto it = uploads_.begin(); it != uploads_.end();) {
    Upload &u = it->second;
    if (now - u.last_activity > cfg_.transfer_timeout) {
      Logger::instance().log(LogLevel::INFO,
                             "ftl0: upload %u from %s timed out",
                             u.file_number, it->first.first.c_str());
      auto dead = it++;
      drop_upload(dead);
      continue;
    }
    if (u.dirty && now - u.last_report >= cfg_.hole_report_interval) {
      HoleList holes;
      if (store_ok(store_.holes(u.handle, holes)))
        reply_holes(u.remote, Ftl0Type::HoleList, u.file_number, holes);
      u.dirty = false;
      u.last_report = now;
    }
    ++it;
  }

  for (auto it = downloads_.begin(); it != downloads_.end();) {
    Download &d = it->second;
    if (now - d.last_activity > cfg_.transfer_timeout) {
      Logger::instance().log(LogLevel::INFO,
                             "ftl0: download %u to %s timed out",
                             d.file_number, it->first.first.c_str());
      it = downloads_.erase(it);
      continue;
    }
    bool sending = d.state != DownloadState::AwaitingAck;
    if (!pump_download(d)) {
      it = downloads_.erase(it);
      continue;
    }
    if (sending)
      d.last_activity = now;
    ++it;
  }

  for (auto it = completed_.begin(); it != completed_.end();) {
    if (now - it->second > cfg_.transfer_timeout)
      it = completed_.erase(it);
    else
      ++it;
  }
}

} // namespace pacsat
