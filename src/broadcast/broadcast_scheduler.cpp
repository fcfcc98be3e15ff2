#include "broadcast_scheduler.hpp"
#include "file_store.hpp"
#include "logging.hpp"
#include <algorithm>
#include <set>

namespace pacsat {

static size_t ceil_div(size_t a, size_t b) { return (a + b - 1) / b; }

uint32_t BroadcastQueueEntry::cursor() const {
  if (kind == BroadcastKind::Directory)
    return header_sent;
  return pending.empty() ? file_size : pending.ranges().front().start;
}

size_t BroadcastQueueEntry::frames_left(size_t header_segment,
                                        size_t chunk_size) const {
  if (kind == BroadcastKind::Directory)
    return ceil_div(header.size() - header_sent, header_segment);
  if (file_size == 0)
    return empty_body_sent ? 0 : 1;
  size_t n = 0;
  for (const auto &r : pending.ranges())
    n += ceil_div(r.length(), chunk_size);
  return n;
}

BroadcastScheduler::BroadcastScheduler(const BroadcastConfig &cfg,
                                       FileStore &store)
    : cfg_(cfg), store_(store) {
  if (cfg_.chunk_size == 0)
    cfg_.chunk_size = 1;
  if (cfg_.header_segment == 0)
    cfg_.header_segment = 1;
  if (cfg_.tick.count() <= 0)
    cfg_.tick = std::chrono::milliseconds(1);
}

size_t BroadcastScheduler::periodic_frames_owed() const {
  size_t n = 0;
  for (const auto &kv : queue_)
    if (kv.second.periodic())
      n += kv.second.frames_left(cfg_.header_segment, cfg_.chunk_size);
  return n;
}

bool BroadcastScheduler::load_directory(BroadcastQueueEntry &e) {
  FileMetadata meta;
  if (store_.metadata(e.file_number, meta) != StoreError::Ok)
    return false;
  if (store_.header_bytes(e.file_number, e.header) != StoreError::Ok)
    return false;
  e.upload_time = meta.upload_time;
  e.header_sent = 0;
  return !e.header.empty();
}

bool BroadcastScheduler::insert(BroadcastQueueEntry &&e) {
  e.seq = next_seq_++;
  Key k{e.priority, e.seq};
  return queue_.emplace(k, std::move(e)).second;
}

void BroadcastScheduler::start_cycle(SteadyTime now) {
  std::set<uint32_t> queued;
  for (const auto &kv : queue_)
    if (kv.second.periodic())
      queued.insert(kv.second.file_number);
  size_t added = 0;
  for (uint32_t number : store_.active_numbers()) {
    if (queued.count(number))
      continue;
    BroadcastQueueEntry e;
    e.file_number = number;
    e.kind = BroadcastKind::Directory;
    if (!load_directory(e))
      continue;
    insert(std::move(e));
    added++;
  }
  cycle_started_ = true;
  deadline_ = now + cfg_.directory_interval;
  on_demand_served_ = 0;
  Logger::instance().log(LogLevel::DEBUG,
                         "broadcast: directory cycle, %zu entries queued",
                         added);
}

BroadcastScheduler::Queue::iterator
BroadcastScheduler::find_on_demand(uint32_t file_number, BroadcastKind kind) {
  for (auto it = queue_.begin(); it != queue_.end(); ++it)
    if (!it->second.periodic() && it->second.file_number == file_number &&
        it->second.kind == kind)
      return it;
  return queue_.end();
}

void BroadcastScheduler::raise_priority(Queue::iterator it, uint8_t priority) {
  if (priority <= it->first.priority)
    return;
  auto node = queue_.extract(it);
  node.key().priority = priority;
  node.mapped().priority = priority;
  queue_.insert(std::move(node));
}

bool BroadcastScheduler::enqueue_on_demand(uint32_t file_number,
                                           uint8_t priority,
                                           BroadcastKind kind) {
  priority = std::max<uint8_t>(priority, 1);
  FileMetadata meta;
  if (store_.metadata(file_number, meta) != StoreError::Ok)
    return false;
  auto it = find_on_demand(file_number, kind);
  if (it != queue_.end()) {
    if (kind == BroadcastKind::File)
      it->second.pending.add(0, meta.size);
    raise_priority(it, priority);
    return true;
  }
  BroadcastQueueEntry e;
  e.file_number = file_number;
  e.priority = priority;
  e.kind = kind;
  if (kind == BroadcastKind::Directory) {
    if (!load_directory(e))
      return false;
  } else {
    e.file_size = meta.size;
    e.pending = HoleList(meta.size);
  }
  Logger::instance().log(LogLevel::INFO,
                         "broadcast: on-demand %s for file %u (priority %u)",
                         kind == BroadcastKind::File ? "body" : "directory",
                         file_number, (unsigned)priority);
  return insert(std::move(e));
}

bool BroadcastScheduler::enqueue_ranges(uint32_t file_number,
                                        const std::vector<ByteRange> &ranges,
                                        uint8_t priority) {
  if (ranges.empty())
    return enqueue_on_demand(file_number, priority, BroadcastKind::File);
  priority = std::max<uint8_t>(priority, 1);
  FileMetadata meta;
  if (store_.metadata(file_number, meta) != StoreError::Ok)
    return false;
  HoleList wanted;
  for (const auto &r : ranges)
    wanted.add(r.start, std::min(r.end, meta.size));
  if (wanted.empty())
    return false;

  auto it = find_on_demand(file_number, BroadcastKind::File);
  if (it != queue_.end()) {
    for (const auto &r : wanted.ranges())
      it->second.pending.add(r.start, r.end);
    raise_priority(it, priority);
    return true;
  }
  BroadcastQueueEntry e;
  e.file_number = file_number;
  e.priority = priority;
  e.kind = BroadcastKind::File;
  e.file_size = meta.size;
  e.pending = wanted;
  Logger::instance().log(LogLevel::INFO,
                         "broadcast: %zu range(s) of file %u (priority %u)",
                         wanted.ranges().size(), file_number,
                         (unsigned)priority);
  return insert(std::move(e));
}

std::optional<Ax25Frame>
BroadcastScheduler::next_directory_frame(BroadcastQueueEntry &e) {
  size_t seg = std::min(cfg_.header_segment, e.header.size() - e.header_sent);
  DirectoryEntry d;
  d.file_number = e.file_number;
  d.offset = e.header_sent;
  d.t_old = e.upload_time;
  d.t_new = e.upload_time;
  d.header.assign(e.header.begin() + e.header_sent,
                  e.header.begin() + e.header_sent + seg);
  e.header_sent += (uint32_t)seg;
  if (e.header_sent == e.header.size())
    d.flags |= BF_LAST;
  return Ax25Frame::ui(cfg_.destination, cfg_.source, kPidDirectory,
                       encode_directory_entry(d));
}

std::optional<Ax25Frame>
BroadcastScheduler::next_file_frame(BroadcastQueueEntry &e) {
  uint32_t offset = e.cursor();
  uint32_t len = 0;
  if (e.file_size == 0)
    e.empty_body_sent = true;
  else
    len = (uint32_t)std::min<size_t>(cfg_.chunk_size,
                                     e.pending.ranges().front().length());
  Pfh pfh;
  FileChunk c;
  StoreError err = store_.download(e.file_number, offset, len, pfh, c.data);
  if (err != StoreError::Ok) {
    Logger::instance().log(LogLevel::WARN,
                           "broadcast: read of file %u at %u failed: %s",
                           e.file_number, offset, to_string(err));
    return std::nullopt;
  }
  if (len > 0)
    e.pending.fill(offset, offset + len);
  c.file_number = e.file_number;
  c.file_type = pfh.file_type;
  c.offset = offset;
  if (offset + c.data.size() >= pfh.file_size)
    c.flags |= BF_LAST;
  return Ax25Frame::ui(cfg_.destination, cfg_.source, kPidFileChunk,
                       encode_file_chunk(c));
}

std::optional<Ax25Frame> BroadcastScheduler::serve(Queue::iterator it) {
  BroadcastQueueEntry &e = it->second;
  std::optional<Ax25Frame> f = e.kind == BroadcastKind::Directory
                                   ? next_directory_frame(e)
                                   : next_file_frame(e);
  if (!f || e.frames_left(cfg_.header_segment, cfg_.chunk_size) == 0)
    queue_.erase(it);
  return f;
}

std::optional<Ax25Frame> BroadcastScheduler::tick(SteadyTime now) {
  if (!cycle_started_ || now >= deadline_)
    start_cycle(now);

  for (auto it = queue_.begin(); it != queue_.end();) {
    if (store_.is_active(it->second.file_number)) {
      ++it;
      continue;
    }
    Logger::instance().log(LogLevel::DEBUG,
                           "broadcast: file %u left the store, dropped",
                           it->second.file_number);
    it = queue_.erase(it);
  }

  while (!queue_.empty()) {
    auto on_demand = queue_.begin();
    if (on_demand->second.periodic())
      on_demand = queue_.end();
    auto periodic = queue_.end();
    for (auto it = queue_.begin(); it != queue_.end(); ++it)
      if (it->second.periodic()) {
        periodic = it;
        break;
      }

    size_t ticks_left = 0;
    if (deadline_ > now)
      ticks_left = (size_t)((deadline_ - now) / cfg_.tick);
    // the cap only protects periodic work; once none is owed it no longer
    // holds on-demand frames back
    size_t owed = periodic_frames_owed();
    if (on_demand != queue_.end() &&
        (owed == 0 || (on_demand_served_ < cfg_.max_on_demand_per_cycle &&
                       ticks_left > owed))) {
      auto f = serve(on_demand);
      if (f) {
        on_demand_served_++;
        return f;
      }
      continue;
    }
    if (periodic == queue_.end())
      return std::nullopt;
    auto f = serve(periodic);
    if (f)
      return f;
  }
  return std::nullopt;
}

} // namespace pacsat
