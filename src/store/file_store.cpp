#include "file_store.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace fs = std::filesystem;

namespace pacsat {

static const char *kObjects = "objects";
static const char *kTrash = "trash";
static const char *kPending = "pending";
static const char *kCounter = "next_number";
static const char *kIndex = "index.tsv";

const char *to_string(StoreError e) {
  switch (e) {
  case StoreError::Ok:
    return "ok";
  case StoreError::NotFound:
    return "not found";
  case StoreError::Forbidden:
    return "forbidden";
  case StoreError::Overlap:
    return "overlap";
  case StoreError::Conflict:
    return "conflict";
  case StoreError::Rejected:
    return "rejected";
  case StoreError::Invalid:
    return "invalid";
  case StoreError::Io:
    return "i/o error";
  default:
    return "resources exhausted";
  }
}

static StoreError from_errno(int err) {
  if (err == ENOSPC || err == EDQUOT || err == EMFILE || err == ENFILE)
    return StoreError::Exhausted;
  return StoreError::Io;
}

static StoreError from_ec(const std::error_code &ec) {
  if (!ec)
    return StoreError::Ok;
  if (ec.category() == std::generic_category() ||
      ec.category() == std::system_category())
    return from_errno(ec.value());
  return StoreError::Io;
}

static std::string number_name(uint32_t number) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%08x", number);
  return buf;
}

static const char *state_name(FileState s) {
  switch (s) {
  case FileState::Pending:
    return "pending";
  case FileState::Complete:
    return "complete";
  case FileState::Active:
    return "active";
  case FileState::Trashed:
    return "trashed";
  case FileState::Purged:
    return "purged";
  default:
    return "rejected";
  }
}

static FileMetadata make_metadata(const Pfh &h, const std::string &relpath) {
  FileMetadata m;
  m.file_number = h.file_number;
  m.filename = h.filename();
  m.source = h.source;
  m.destination = h.destination;
  if (auto d = h.find<DescriptionItem>())
    m.description = d->text;
  if (auto p = h.find<PriorityItem>())
    m.priority = p->priority;
  if (auto c = h.find<DownloadCountItem>())
    m.download_count = c->count;
  m.size = h.file_size;
  m.upload_time = h.upload_time;
  m.relpath = relpath;
  return m;
}

// Writes data to path through a temporary file and a rename.
static StoreError atomic_write(const fs::path &path, const uint8_t *data,
                               size_t len) {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      return from_errno(errno);
    out.write((const char *)data, (std::streamsize)len);
    out.flush();
    if (!out) {
      StoreError e = from_errno(errno);
      out.close();
      std::error_code ec;
      fs::remove(tmp, ec);
      return e;
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ec2;
    fs::remove(tmp, ec2);
    return from_ec(ec);
  }
  return StoreError::Ok;
}

FileStore::FileStore(std::string root) : root_(std::move(root)) {}

std::string FileStore::object_relpath(uint32_t number) const {
  return hasher_.fanout_path(number) + "/" + number_name(number) + ".pfh";
}

std::string FileStore::object_path(uint32_t number) const {
  return (fs::path(root_) / kObjects / object_relpath(number)).string();
}

std::string FileStore::trash_relpath_for(uint32_t number) const {
  std::string dir = hasher_.fanout_path(number);
  std::string base = number_name(number);
  fs::path trash = fs::path(root_) / kTrash;
  std::string rel = dir + "/" + base + ".pfh";
  for (int n = 1; fs::exists(trash / rel) || trash_.count(rel); n++)
    rel = dir + "/" + base + "~" + std::to_string(n) + ".pfh";
  return rel;
}

StoreError FileStore::open() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!hasher_.ready()) {
    Logger::instance().log(LogLevel::ERROR, "store: libsodium init failed");
    return StoreError::Io;
  }
  std::error_code ec;
  fs::path root(root_);
  for (const char *sub : {kObjects, kTrash, kPending}) {
    fs::create_directories(root / sub, ec);
    if (ec) {
      Logger::instance().log(LogLevel::ERROR, "store: cannot create %s: %s",
                             (root / sub).string().c_str(),
                             ec.message().c_str());
      return from_ec(ec);
    }
  }
  // partial uploads do not survive a restart
  for (auto &e : fs::directory_iterator(root / kPending, ec)) {
    std::error_code rec;
    fs::remove_all(e.path(), rec);
  }

  active_.clear();
  trash_.clear();
  pending_.clear();
  std::map<uint32_t, std::string> known;
  load_index_digests(known);
  uint32_t highest = 0;
  scan_objects(known, highest);
  scan_trash(highest);

  uint32_t stored = 0;
  {
    std::ifstream in(root / kCounter);
    if (in)
      in >> stored;
  }
  next_number_ = std::max<uint32_t>({stored, highest + 1, 1});
  StoreError e = persist_counter();
  if (e != StoreError::Ok)
    return e;
  e = write_index();
  if (e != StoreError::Ok)
    return e;
  Logger::instance().log(LogLevel::INFO,
                         "store: opened %s (%zu active, %zu trashed, next %u)",
                         root_.c_str(), active_.size(), trash_.size(),
                         next_number_);
  return StoreError::Ok;
}

void FileStore::load_index_digests(std::map<uint32_t, std::string> &out) const {
  std::ifstream in(fs::path(root_) / kIndex);
  std::string line;
  while (std::getline(in, line)) {
    std::vector<std::string> cols;
    std::stringstream ss(line);
    std::string col;
    while (std::getline(ss, col, '\t'))
      cols.push_back(col);
    if (cols.size() != 8 || cols[1] != "active")
      continue;
    try {
      out[(uint32_t)std::stoul(cols[0])] = cols[7];
    } catch (const std::exception &) {
      continue;
    }
  }
}

StoreError FileStore::read_header(const std::string &path, PfhView &view,
                                  std::vector<uint8_t> &buf,
                                  uint64_t &file_size) const {
  std::error_code ec;
  file_size = fs::file_size(path, ec);
  if (ec)
    return ec == std::errc::no_such_file_or_directory ? StoreError::NotFound
                                                      : from_ec(ec);
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return from_errno(errno);
  buf.resize((size_t)std::min<uint64_t>(file_size, kPfhMaxHeader));
  in.read((char *)buf.data(), (std::streamsize)buf.size());
  if ((size_t)in.gcount() != buf.size())
    return StoreError::Io;
  if (parse_pfh(buf.data(), buf.size(), view) != HeaderError::Ok)
    return StoreError::Rejected;
  return StoreError::Ok;
}

void FileStore::scan_objects(const std::map<uint32_t, std::string> &known,
                             uint32_t &highest) {
  std::error_code ec;
  fs::path base = fs::path(root_) / kObjects;
  for (auto it = fs::recursive_directory_iterator(base, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const fs::path &p = it->path();
    if (p.extension() == ".tmp") {
      std::error_code rec;
      fs::remove(p, rec);
      continue;
    }
    if (!it->is_regular_file() || p.extension() != ".pfh")
      continue;
    PfhView view;
    std::vector<uint8_t> buf;
    uint64_t size = 0;
    if (read_header(p.string(), view, buf, size) != StoreError::Ok) {
      Logger::instance().log(LogLevel::WARN, "store: unreadable header in %s",
                             p.string().c_str());
      continue;
    }
    uint32_t number = view.header.file_number;
    if (number == 0 || object_path(number) != p.string() ||
        size != view.header_len + (uint64_t)view.header.file_size) {
      Logger::instance().log(LogLevel::WARN, "store: misplaced blob %s",
                             p.string().c_str());
      continue;
    }
    FileMetadata m = make_metadata(view.header, object_relpath(number));
    auto k = known.find(number);
    if (k != known.end())
      m.digest = k->second;
    else
      hasher_.digest_file(p.string(), m.digest);
    active_[number] = std::move(m);
    highest = std::max(highest, number);
  }
}

void FileStore::scan_trash(uint32_t &highest) {
  std::error_code ec;
  fs::path base = fs::path(root_) / kTrash;
  for (auto it = fs::recursive_directory_iterator(base, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const fs::path &p = it->path();
    if (!it->is_regular_file() || p.extension() != ".pfh")
      continue;
    PfhView view;
    std::vector<uint8_t> buf;
    uint64_t size = 0;
    if (read_header(p.string(), view, buf, size) != StoreError::Ok) {
      Logger::instance().log(LogLevel::WARN, "store: unreadable trash %s",
                             p.string().c_str());
      continue;
    }
    TrashEntry t;
    t.trash_name = fs::relative(p, base).generic_string();
    t.meta = make_metadata(view.header, t.trash_name);
    t.meta.state = FileState::Trashed;
    hasher_.digest_file(p.string(), t.meta.digest);
    std::error_code tec;
    t.trashed_at = fs::last_write_time(p, tec);
    highest = std::max(highest, view.header.file_number);
    trash_[t.trash_name] = std::move(t);
  }
}

StoreError FileStore::persist_counter() {
  std::string s = std::to_string(next_number_) + "\n";
  return atomic_write(fs::path(root_) / kCounter, (const uint8_t *)s.data(),
                      s.size());
}

StoreError FileStore::write_index() {
  std::string out;
  auto row = [&out](const FileMetadata &m, FileState state,
                    const std::string &rel) {
    out += std::to_string(m.file_number) + "\t" + state_name(state) + "\t" +
           rel + "\t" +
           std::to_string(m.size) + "\t" + std::to_string(m.upload_time) +
           "\t" + m.source + "\t" + m.filename + "\t" + m.digest + "\n";
  };
  for (const auto &kv : active_)
    row(kv.second, FileState::Active,
        std::string(kObjects) + "/" + kv.second.relpath);
  for (const auto &kv : trash_)
    row(kv.second.meta, FileState::Trashed,
        std::string(kTrash) + "/" + kv.first);
  StoreError e = atomic_write(fs::path(root_) / kIndex,
                              (const uint8_t *)out.data(), out.size());
  if (e != StoreError::Ok)
    Logger::instance().log(LogLevel::ERROR, "store: index write failed: %s",
                           to_string(e));
  return e;
}

void FileStore::prune_dirs(fs::path dir, const fs::path &stop) {
  std::error_code ec;
  while (dir != stop && fs::is_directory(dir, ec) && fs::is_empty(dir, ec)) {
    fs::remove(dir, ec);
    if (ec)
      break;
    dir = dir.parent_path();
  }
}

StoreError FileStore::allocate_file_number(uint32_t &out) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (next_number_ == 0)
    return StoreError::Exhausted; // wrapped past 0xFFFFFFFF
  uint32_t n = next_number_;
  next_number_++;
  StoreError e = persist_counter();
  if (e != StoreError::Ok)
    return e;
  out = n;
  return StoreError::Ok;
}

// ---- uploads --------------------------------------------------------------

StoreError FileStore::begin_receive(const Pfh &stub, uint32_t expected_size,
                                    TransferHandle &out) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stub.file_number == 0 || expected_size == 0)
    return StoreError::Invalid;
  if (active_.count(stub.file_number))
    return StoreError::Conflict;
  for (const auto &kv : pending_)
    if (kv.second.stub.file_number == stub.file_number)
      return StoreError::Conflict;

  TransferHandle h = next_handle_++;
  Pending p;
  p.stub = stub;
  p.size = expected_size;
  p.holes = HoleList(expected_size);
  p.path = (fs::path(root_) / kPending / (std::to_string(h) + ".part")).string();
  {
    std::ofstream create(p.path, std::ios::binary | std::ios::trunc);
    if (!create)
      return from_errno(errno);
  }
  std::error_code ec;
  fs::resize_file(p.path, expected_size, ec);
  if (ec) {
    std::error_code rec;
    fs::remove(p.path, rec);
    return from_ec(ec);
  }
  p.stream.reset(new std::fstream(p.path, std::ios::binary | std::ios::in |
                                              std::ios::out));
  if (!*p.stream) {
    StoreError e = from_errno(errno);
    std::error_code rec;
    fs::remove(p.path, rec);
    return e;
  }
  pending_.emplace(h, std::move(p));
  out = h;
  Logger::instance().log(LogLevel::INFO,
                         "store: receiving file %u (%u bytes) handle %llu",
                         stub.file_number, expected_size,
                         (unsigned long long)h);
  return StoreError::Ok;
}

StoreError FileStore::write_chunk(TransferHandle h, uint32_t offset,
                                  const uint8_t *data, size_t len,
                                  ChunkOutcome *outcome) {
  std::lock_guard<std::mutex> lk(mtx_);
  ChunkOutcome local;
  ChunkOutcome &oc = outcome ? *outcome : local;
  oc = ChunkOutcome{};
  auto it = pending_.find(h);
  if (it == pending_.end())
    return StoreError::NotFound;
  Pending &p = it->second;
  oc.file_number = p.stub.file_number;
  if ((uint64_t)offset + len > p.size)
    return StoreError::Overlap;
  if (len == 0)
    return StoreError::Ok;
  uint32_t end = offset + (uint32_t)len;

  // only bytes still missing are written; filled territory stays as it was
  for (const auto &hole : p.holes.ranges()) {
    if (hole.end <= offset || hole.start >= end)
      continue;
    uint32_t lo = std::max(hole.start, offset);
    uint32_t hi = std::min(hole.end, end);
    p.stream->seekp(lo);
    p.stream->write((const char *)data + (lo - offset), hi - lo);
  }
  p.stream->flush();
  if (!*p.stream) {
    StoreError e = from_errno(errno);
    Logger::instance().log(LogLevel::ERROR,
                           "store: write to %s failed: %s", p.path.c_str(),
                           to_string(e));
    p.stream->clear();
    return e;
  }
  oc.new_bytes = p.holes.fill(offset, end);
  if (!p.holes.empty())
    return StoreError::Ok;
  return finish_receive(h, p, oc);
}

StoreError FileStore::finish_receive(TransferHandle h, Pending &p,
                                     ChunkOutcome &oc) {
  p.stream->close();
  std::vector<uint8_t> blob(p.size);
  {
    std::ifstream in(p.path, std::ios::binary);
    in.read((char *)blob.data(), (std::streamsize)blob.size());
    if ((size_t)in.gcount() != blob.size())
      return from_errno(errno);
  }
  std::string path = p.path;
  Pfh stub = p.stub;
  pending_.erase(h);
  std::error_code ec;
  fs::remove(path, ec);

  PfhView view;
  oc.header_error = parse_pfh(blob.data(), blob.size(), view);
  if (oc.header_error != HeaderError::Ok) {
    oc.state = FileState::Rejected;
    Logger::instance().log(LogLevel::WARN, "store: file %u rejected: %s",
                           stub.file_number, to_string(oc.header_error));
    return StoreError::Rejected;
  }
  Pfh header = view.header;
  if (view.body_len != header.file_size ||
      body_checksum(view.body, view.body_len) != header.body_checksum) {
    oc.state = FileState::Rejected;
    Logger::instance().log(LogLevel::WARN,
                           "store: file %u rejected: body does not match header",
                           stub.file_number);
    return StoreError::Rejected;
  }
  oc.state = FileState::Complete;

  header.file_number = stub.file_number;
  header.upload_time = stub.upload_time;
  if (!stub.source.empty())
    header.source = stub.source;
  std::vector<uint8_t> out = serialize_pfh(header);
  out.insert(out.end(), view.body, view.body + view.body_len);
  FileMetadata meta;
  StoreError e = commit_blob(header.file_number, out, meta);
  if (e != StoreError::Ok)
    return e;
  oc.state = FileState::Active;
  Logger::instance().log(LogLevel::INFO, "store: file %u %s active (%u bytes)",
                         header.file_number, meta.filename.c_str(), meta.size);
  return StoreError::Ok;
}

StoreError FileStore::holes(TransferHandle h, HoleList &out) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = pending_.find(h);
  if (it == pending_.end())
    return StoreError::NotFound;
  out = it->second.holes;
  return StoreError::Ok;
}

StoreError FileStore::pending_prefix(TransferHandle h, std::vector<uint8_t> &out,
                                     size_t max_len) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = pending_.find(h);
  if (it == pending_.end())
    return StoreError::NotFound;
  const Pending &p = it->second;
  uint32_t n = p.holes.contiguous_prefix(p.size);
  n = (uint32_t)std::min<uint64_t>(n, max_len);
  out.resize(n);
  if (n == 0)
    return StoreError::Ok;
  std::ifstream in(p.path, std::ios::binary);
  in.read((char *)out.data(), n);
  if ((uint32_t)in.gcount() != n)
    return from_errno(errno);
  return StoreError::Ok;
}

StoreError FileStore::abandon(TransferHandle h) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = pending_.find(h);
  if (it == pending_.end())
    return StoreError::NotFound;
  it->second.stream->close();
  std::error_code ec;
  fs::remove(it->second.path, ec);
  Logger::instance().log(LogLevel::INFO,
                         "store: abandoned partial file %u (%u bytes missing)",
                         it->second.stub.file_number,
                         it->second.holes.missing_bytes());
  pending_.erase(it);
  return StoreError::Ok;
}

StoreError FileStore::commit_blob(uint32_t number,
                                  const std::vector<uint8_t> &blob,
                                  FileMetadata &meta) {
  fs::path path = object_path(number);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec)
    return from_ec(ec);
  StoreError e = atomic_write(path, blob.data(), blob.size());
  if (e != StoreError::Ok) {
    Logger::instance().log(LogLevel::ERROR, "store: commit of %u failed: %s",
                           number, to_string(e));
    return e;
  }
  PfhView view;
  if (parse_pfh(blob.data(), blob.size(), view) != HeaderError::Ok)
    return StoreError::Invalid;
  meta = make_metadata(view.header, object_relpath(number));
  meta.digest = hasher_.digest_hex(blob.data(), blob.size());
  active_[number] = meta;
  return write_index();
}

StoreError FileStore::store_file(const Pfh &pfh,
                                 const std::vector<uint8_t> &body,
                                 uint32_t &number) {
  if (body.size() > 0xFFFFFFFFull)
    return StoreError::Invalid;
  Pfh h = pfh;
  h.file_size = (uint32_t)body.size();
  h.body_checksum = body_checksum(body.data(), body.size());
  if (h.upload_time == 0)
    h.upload_time = (uint32_t)std::time(nullptr);
  if (!pfh_valid(h))
    return StoreError::Invalid;
  uint32_t n = 0;
  StoreError e = allocate_file_number(n);
  if (e != StoreError::Ok)
    return e;
  h.file_number = n;
  std::vector<uint8_t> blob = serialize_pfh(h);
  blob.insert(blob.end(), body.begin(), body.end());
  std::lock_guard<std::mutex> lk(mtx_);
  FileMetadata meta;
  e = commit_blob(n, blob, meta);
  if (e != StoreError::Ok)
    return e;
  number = n;
  Logger::instance().log(LogLevel::INFO, "store: stored file %u %s (%zu bytes)",
                         n, meta.filename.c_str(), body.size());
  return StoreError::Ok;
}

// ---- retrieval ------------------------------------------------------------

StoreError FileStore::download(uint32_t number, uint32_t offset,
                               uint32_t length, Pfh &pfh,
                               std::vector<uint8_t> &body) const {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!active_.count(number))
    return StoreError::NotFound;
  std::string path = object_path(number);
  PfhView view;
  std::vector<uint8_t> buf;
  uint64_t size = 0;
  StoreError e = read_header(path, view, buf, size);
  if (e != StoreError::Ok)
    return e;
  uint32_t body_len = view.header.file_size;
  if (offset > body_len)
    return StoreError::Invalid;
  uint32_t n = std::min(length, body_len - offset);
  body.resize(n);
  if (n > 0) {
    std::ifstream in(path, std::ios::binary);
    in.seekg((std::streamoff)(view.header_len + offset));
    in.read((char *)body.data(), n);
    if ((uint32_t)in.gcount() != n)
      return StoreError::Io;
  }
  pfh = view.header;
  return StoreError::Ok;
}

StoreError FileStore::download_raw(uint32_t number,
                                   std::vector<uint8_t> &blob) const {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!active_.count(number))
    return StoreError::NotFound;
  std::string path = object_path(number);
  std::error_code ec;
  uint64_t size = fs::file_size(path, ec);
  if (ec)
    return from_ec(ec);
  blob.resize((size_t)size);
  std::ifstream in(path, std::ios::binary);
  in.read((char *)blob.data(), (std::streamsize)size);
  if ((uint64_t)in.gcount() != size)
    return StoreError::Io;
  return StoreError::Ok;
}

StoreError FileStore::header_bytes(uint32_t number,
                                   std::vector<uint8_t> &out) const {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!active_.count(number))
    return StoreError::NotFound;
  PfhView view;
  uint64_t size = 0;
  StoreError e = read_header(object_path(number), view, out, size);
  if (e != StoreError::Ok)
    return e;
  out.resize(view.header_len);
  return StoreError::Ok;
}

StoreError FileStore::metadata(uint32_t number, FileMetadata &out) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = active_.find(number);
  if (it == active_.end())
    return StoreError::NotFound;
  out = it->second;
  return StoreError::Ok;
}

StoreError FileStore::record_download(uint32_t number) {
  std::vector<uint8_t> blob;
  StoreError e = download_raw(number, blob);
  if (e != StoreError::Ok)
    return e;
  PfhView view;
  if (parse_pfh(blob.data(), blob.size(), view) != HeaderError::Ok)
    return StoreError::Rejected;
  Pfh h = view.header;
  uint32_t count = 0;
  if (auto c = h.find<DownloadCountItem>())
    count = c->count;
  h.set(DownloadCountItem{count + 1});
  std::vector<uint8_t> out = serialize_pfh(h);
  out.insert(out.end(), view.body, view.body + view.body_len);
  std::lock_guard<std::mutex> lk(mtx_);
  if (!active_.count(number))
    return StoreError::NotFound;
  FileMetadata meta;
  return commit_blob(number, out, meta);
}

StoreError FileStore::verify(uint32_t number) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = active_.find(number);
  if (it == active_.end())
    return StoreError::NotFound;
  std::string hex;
  if (!hasher_.digest_file(object_path(number), hex))
    return StoreError::Io;
  if (hex != it->second.digest) {
    Logger::instance().log(LogLevel::WARN, "store: file %u digest mismatch",
                           number);
    return StoreError::Rejected;
  }
  return StoreError::Ok;
}

// ---- deletion -------------------------------------------------------------

StoreError FileStore::soft_delete(uint32_t number, const Actor &actor,
                                  std::string *trash_name) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = active_.find(number);
  if (it == active_.end())
    return StoreError::NotFound;
  if (!actor.privileged && !iequals(actor.callsign, it->second.source)) {
    Logger::instance().log(LogLevel::WARN,
                           "store: %s may not delete file %u owned by %s",
                           actor.callsign.c_str(), number,
                           it->second.source.c_str());
    return StoreError::Forbidden;
  }
  fs::path from = object_path(number);
  std::string rel = trash_relpath_for(number);
  fs::path to = fs::path(root_) / kTrash / rel;
  std::error_code ec;
  fs::create_directories(to.parent_path(), ec);
  if (ec)
    return from_ec(ec);
  fs::rename(from, to, ec);
  if (ec)
    return from_ec(ec);
  fs::last_write_time(to, fs::file_time_type::clock::now(), ec);

  TrashEntry t;
  t.trash_name = rel;
  t.meta = it->second;
  t.meta.state = FileState::Trashed;
  t.trashed_at = fs::file_time_type::clock::now();
  trash_[rel] = t;
  active_.erase(it);
  prune_dirs(from.parent_path(), fs::path(root_) / kObjects);
  if (trash_name)
    *trash_name = rel;
  Logger::instance().log(LogLevel::INFO, "store: file %u moved to trash as %s",
                         number, rel.c_str());
  return write_index();
}

StoreError FileStore::recover(const std::string &trash_name,
                              uint32_t &number) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = trash_.find(trash_name);
  if (it == trash_.end())
    return StoreError::NotFound;
  uint32_t n = it->second.meta.file_number;
  fs::path to = object_path(n);
  std::error_code ec;
  if (active_.count(n) || fs::exists(to, ec)) {
    Logger::instance().log(LogLevel::WARN,
                           "store: cannot recover %s, file %u is active",
                           trash_name.c_str(), n);
    return StoreError::Conflict;
  }
  fs::path from = fs::path(root_) / kTrash / trash_name;
  fs::create_directories(to.parent_path(), ec);
  if (ec)
    return from_ec(ec);
  fs::rename(from, to, ec);
  if (ec)
    return from_ec(ec);
  FileMetadata meta = it->second.meta;
  meta.state = FileState::Active;
  meta.relpath = object_relpath(n);
  active_[n] = meta;
  trash_.erase(it);
  prune_dirs(from.parent_path(), fs::path(root_) / kTrash);
  number = n;
  Logger::instance().log(LogLevel::INFO, "store: recovered file %u from %s", n,
                         trash_name.c_str());
  return write_index();
}

StoreError FileStore::purge(uint32_t number) {
  std::lock_guard<std::mutex> lk(mtx_);
  bool found = false;
  std::error_code ec;
  auto it = active_.find(number);
  if (it != active_.end()) {
    fs::path p = object_path(number);
    fs::remove(p, ec);
    if (ec)
      return from_ec(ec);
    active_.erase(it);
    prune_dirs(p.parent_path(), fs::path(root_) / kObjects);
    found = true;
  }
  for (auto t = trash_.begin(); t != trash_.end();) {
    if (t->second.meta.file_number != number) {
      ++t;
      continue;
    }
    fs::path p = fs::path(root_) / kTrash / t->first;
    fs::remove(p, ec);
    if (ec)
      return from_ec(ec);
    prune_dirs(p.parent_path(), fs::path(root_) / kTrash);
    t = trash_.erase(t);
    found = true;
  }
  if (!found)
    return StoreError::NotFound;
  Logger::instance().log(LogLevel::INFO, "store: purged file %u", number);
  return write_index();
}

StoreError FileStore::purge_trash(const std::string &trash_name) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = trash_.find(trash_name);
  if (it == trash_.end())
    return StoreError::NotFound;
  fs::path p = fs::path(root_) / kTrash / trash_name;
  std::error_code ec;
  fs::remove(p, ec);
  if (ec)
    return from_ec(ec);
  prune_dirs(p.parent_path(), fs::path(root_) / kTrash);
  Logger::instance().log(LogLevel::INFO, "store: purged trash %s (file %u)",
                         trash_name.c_str(), it->second.meta.file_number);
  trash_.erase(it);
  return write_index();
}

size_t FileStore::purge_expired_trash(std::chrono::seconds retention) {
  std::vector<std::string> expired;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto cutoff = fs::file_time_type::clock::now() - retention;
    for (const auto &kv : trash_)
      if (kv.second.trashed_at <= cutoff)
        expired.push_back(kv.first);
  }
  size_t n = 0;
  for (const auto &name : expired)
    if (purge_trash(name) == StoreError::Ok)
      n++;
  return n;
}

std::vector<TrashEntry> FileStore::list_trash() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<TrashEntry> out;
  out.reserve(trash_.size());
  for (const auto &kv : trash_)
    out.push_back(kv.second);
  return out;
}

// ---- queries --------------------------------------------------------------

std::vector<FileMetadata> FileStore::list(const ListFilter &filter,
                                          const ListSort &sort,
                                          const Page &page) const {
  std::vector<FileMetadata> rows;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &kv : active_) {
      const FileMetadata &m = kv.second;
      if (!filter.source.empty() && !iequals(filter.source, m.source))
        continue;
      if (!icontains(m.filename, filter.name))
        continue;
      if (m.priority < filter.min_priority)
        continue;
      rows.push_back(m);
    }
  }
  auto less = [&sort](const FileMetadata &a, const FileMetadata &b) {
    switch (sort.key) {
    case SortKey::UploadTime:
      if (a.upload_time != b.upload_time)
        return a.upload_time < b.upload_time;
      break;
    case SortKey::Size:
      if (a.size != b.size)
        return a.size < b.size;
      break;
    case SortKey::Name:
      if (a.filename != b.filename)
        return a.filename < b.filename;
      break;
    case SortKey::Number:
      break;
    }
    return a.file_number < b.file_number;
  };
  if (sort.descending)
    std::stable_sort(rows.begin(), rows.end(),
                     [&less](const FileMetadata &a, const FileMetadata &b) {
                       return less(b, a);
                     });
  else
    std::stable_sort(rows.begin(), rows.end(), less);

  if (page.size == 0)
    return rows;
  size_t first = page.index * page.size;
  if (first >= rows.size())
    return {};
  size_t last = std::min(rows.size(), first + page.size);
  return std::vector<FileMetadata>(rows.begin() + first, rows.begin() + last);
}

std::vector<FileMetadata> FileStore::search(const std::string &query) const {
  std::vector<FileMetadata> rows;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &kv : active_) {
      const FileMetadata &m = kv.second;
      if (icontains(m.filename, query) || icontains(m.source, query) ||
          icontains(m.destination, query) || icontains(m.description, query))
        rows.push_back(m);
    }
  }
  std::sort(rows.begin(), rows.end(),
            [](const FileMetadata &a, const FileMetadata &b) {
              if (a.upload_time != b.upload_time)
                return a.upload_time > b.upload_time;
              return a.file_number > b.file_number;
            });
  return rows;
}

std::vector<uint32_t> FileStore::active_numbers() const {
  ListSort newest{SortKey::UploadTime, true};
  std::vector<FileMetadata> rows = list(ListFilter{}, newest, Page{0, 0});
  std::vector<uint32_t> out;
  out.reserve(rows.size());
  for (const auto &m : rows)
    out.push_back(m.file_number);
  return out;
}

bool FileStore::is_active(uint32_t number) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return active_.count(number) != 0;
}

StoreStats FileStore::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  StoreStats s;
  s.active_files = active_.size();
  for (const auto &kv : active_)
    s.active_bytes += kv.second.size;
  s.trashed_files = trash_.size();
  s.pending_transfers = pending_.size();
  return s;
}

} // namespace pacsat
