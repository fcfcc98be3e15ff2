#include "pfh.hpp"
#include "protocol.hpp"
#include "util.hpp"

namespace pacsat {

static constexpr uint8_t kMagic0 = 0xAA;
static constexpr uint8_t kMagic1 = 0x55;
static constexpr size_t kItemHead = 3;
// value of item 0x0B: magic, items 0x01 to 0x0A, then the 0x0B item head
static constexpr size_t kBodyOffsetPos = 2 + 7 + 11 + 6 + 7 + 7 + 4 + 5 + 4 + 3;

const char *to_string(HeaderError e) {
  switch (e) {
  case HeaderError::Ok:
    return "ok";
  case HeaderError::Truncated:
    return "truncated";
  case HeaderError::BadMagic:
    return "bad magic";
  case HeaderError::BadChecksum:
    return "bad checksum";
  case HeaderError::UnknownMandatoryItem:
    return "unknown mandatory item";
  case HeaderError::MissingMandatoryItem:
    return "missing mandatory item";
  default:
    return "bad item length";
  }
}

std::string Pfh::filename() const {
  if (ext.empty())
    return name;
  return name + "." + ext;
}

bool Pfh::operator==(const Pfh &o) const {
  return file_number == o.file_number && name == o.name && ext == o.ext &&
         file_size == o.file_size && create_time == o.create_time &&
         file_type == o.file_type && body_checksum == o.body_checksum &&
         source == o.source && upload_time == o.upload_time &&
         destination == o.destination && optional == o.optional;
}

uint16_t body_checksum(const uint8_t *data, size_t len) {
  uint16_t sum = 0;
  for (size_t i = 0; i < len; i++)
    sum = (uint16_t)(sum + data[i]);
  return sum;
}

// ---- decoding -------------------------------------------------------------

namespace {

enum Seen : uint32_t {
  S_NUMBER = 1u << 0,
  S_NAME = 1u << 1,
  S_EXT = 1u << 2,
  S_SIZE = 1u << 3,
  S_CREATE = 1u << 4,
  S_TYPE = 1u << 5,
  S_BODYSUM = 1u << 6,
  S_HDRSUM = 1u << 7,
  S_OFFSET = 1u << 8,
  S_SOURCE = 1u << 9,
  S_UPLOAD = 1u << 10,
  S_DEST = 1u << 11,
  S_ALL = (1u << 12) - 1
};

struct ItemCtx {
  Pfh &h;
  uint32_t seen;
  uint16_t body_offset;
};

using ItemDecoder = void (*)(const uint8_t *d, uint8_t len, ItemCtx &ctx);

struct ItemRule {
  uint16_t id;
  uint8_t fixed_len; // 0 = variable
  uint32_t seen_bit;
  ItemDecoder decode;
};

std::string text(const uint8_t *d, uint8_t len) {
  return trim_right(std::string((const char *)d, len));
}

const ItemRule kRules[] = {
    {pfh_item::FileNumber, 4, S_NUMBER,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.file_number = get_le32(d);
     }},
    {pfh_item::FileName, 8, S_NAME,
     [](const uint8_t *d, uint8_t l, ItemCtx &c) { c.h.name = text(d, l); }},
    {pfh_item::FileExt, 3, S_EXT,
     [](const uint8_t *d, uint8_t l, ItemCtx &c) { c.h.ext = text(d, l); }},
    {pfh_item::FileSize, 4, S_SIZE,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.file_size = get_le32(d);
     }},
    {pfh_item::CreateTime, 4, S_CREATE,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.create_time = get_le32(d);
     }},
    {pfh_item::FileType, 1, S_TYPE,
     [](const uint8_t *d, uint8_t, ItemCtx &c) { c.h.file_type = d[0]; }},
    {pfh_item::BodyChecksum, 2, S_BODYSUM,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.body_checksum = get_le16(d);
     }},
    {pfh_item::HeaderChecksum, 1, S_HDRSUM,
     [](const uint8_t *, uint8_t, ItemCtx &) {}},
    {pfh_item::BodyOffset, 2, S_OFFSET,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.body_offset = get_le16(d);
     }},
    {pfh_item::Source, 0, S_SOURCE,
     [](const uint8_t *d, uint8_t l, ItemCtx &c) { c.h.source = text(d, l); }},
    {pfh_item::UploadTime, 4, S_UPLOAD,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.upload_time = get_le32(d);
     }},
    {pfh_item::Destination, 0, S_DEST,
     [](const uint8_t *d, uint8_t l, ItemCtx &c) {
       c.h.destination = text(d, l);
     }},
    {pfh_item::DownloadCount, 4, 0,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.optional.emplace_back(DownloadCountItem{get_le32(d)});
     }},
    {pfh_item::Priority, 1, 0,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.optional.emplace_back(PriorityItem{d[0]});
     }},
    {pfh_item::CompressionType, 1, 0,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.optional.emplace_back(CompressionItem{d[0]});
     }},
    {pfh_item::BbsText, 1, 0,
     [](const uint8_t *d, uint8_t, ItemCtx &c) {
       c.h.optional.emplace_back(BbsTextItem{d[0]});
     }},
    {pfh_item::Description, 0, 0,
     [](const uint8_t *d, uint8_t l, ItemCtx &c) {
       c.h.optional.emplace_back(
           DescriptionItem{std::string((const char *)d, l)});
     }},
    {pfh_item::Forwarding, 0, 0,
     [](const uint8_t *d, uint8_t l, ItemCtx &c) {
       ForwardingItem f;
       std::string s((const char *)d, l);
       size_t start = 0;
       while (start <= s.size()) {
         size_t semi = s.find(';', start);
         if (semi == std::string::npos)
           semi = s.size();
         f.destinations.push_back(s.substr(start, semi - start));
         start = semi + 1;
       }
       c.h.optional.emplace_back(std::move(f));
     }},
};

const ItemRule *find_rule(uint16_t id) {
  for (const auto &r : kRules)
    if (r.id == id)
      return &r;
  return nullptr;
}

} // namespace

static uint8_t byte_sum(const uint8_t *data, size_t len) {
  uint8_t sum = 0;
  for (size_t i = 0; i < len; i++)
    sum = (uint8_t)(sum + data[i]);
  return sum;
}

// True when the item chain ends with the terminator exactly at hlen.
static bool terminated_at(const uint8_t *data, size_t hlen) {
  size_t off = 2;
  while (off + kItemHead <= hlen) {
    if (get_le16(data + off) == pfh_item::End && data[off + 2] == 0)
      return off + kItemHead == hlen;
    off += kItemHead + data[off + 2];
  }
  return false;
}

// Walks item lengths to the terminator. A header that cannot end within
// kPfhMaxHeader bytes is rejected, so a buffer of that size is never
// Truncated.
static HeaderError find_terminator(const uint8_t *data, size_t len,
                                   size_t &hlen) {
  size_t off = 2;
  for (;;) {
    if (off + kItemHead > kPfhMaxHeader)
      return HeaderError::BadItemLength;
    if (len - off < kItemHead)
      return HeaderError::Truncated;
    uint8_t l = data[off + 2];
    if (get_le16(data + off) == pfh_item::End && l == 0) {
      hlen = off + kItemHead;
      return HeaderError::Ok;
    }
    // the terminator still has to follow this item
    if (off + 2 * kItemHead + l > kPfhMaxHeader)
      return HeaderError::BadItemLength;
    if (len - off - kItemHead < l)
      return HeaderError::Truncated;
    off += kItemHead + l;
  }
}

HeaderError parse_pfh(const uint8_t *data, size_t len, PfhView &out) {
  if (len < 2)
    return HeaderError::Truncated;
  if (data[0] != kMagic0 || data[1] != kMagic1)
    return HeaderError::BadMagic;

  // Mandatory items come first in a fixed order with fixed lengths, so the
  // body offset item sits at a known position. When its head is recognisable
  // (id or length intact) its value bounds the checksum, and a damaged length
  // byte elsewhere fails the checksum instead of derailing the item walk.
  size_t hlen = 0;
  const size_t head = kBodyOffsetPos - kItemHead;
  if (len >= kBodyOffsetPos + 2 &&
      (get_le16(data + head) == pfh_item::BodyOffset || data[head + 2] == 2)) {
    size_t declared = get_le16(data + kBodyOffsetPos);
    if (declared >= kBodyOffsetPos + 2 + kItemHead && declared <= len) {
      if (byte_sum(data, declared) != 0)
        return HeaderError::BadChecksum;
      if (terminated_at(data, declared))
        hlen = declared;
    }
  }
  if (hlen == 0) {
    HeaderError e = find_terminator(data, len, hlen);
    if (e != HeaderError::Ok)
      return e;
    if (byte_sum(data, hlen) != 0)
      return HeaderError::BadChecksum;
  }

  Pfh h;
  ItemCtx ctx{h, 0, 0};
  size_t off = 2;
  while (off + kItemHead < hlen) {
    uint16_t id = get_le16(data + off);
    uint8_t l = data[off + 2];
    const uint8_t *d = data + off + kItemHead;
    off += kItemHead + l;
    const ItemRule *rule = find_rule(id);
    if (!rule) {
      if (id <= pfh_item::LastMandatory)
        return HeaderError::UnknownMandatoryItem;
      h.optional.emplace_back(RawItem{id, std::vector<uint8_t>(d, d + l)});
      continue;
    }
    if (rule->fixed_len != 0 && rule->fixed_len != l)
      return HeaderError::BadItemLength;
    rule->decode(d, l, ctx);
    ctx.seen |= rule->seen_bit;
  }
  if ((ctx.seen & S_ALL) != S_ALL)
    return HeaderError::MissingMandatoryItem;
  if (ctx.body_offset != hlen)
    return HeaderError::BadItemLength;

  out.header = std::move(h);
  out.header_len = hlen;
  out.body = data + hlen;
  out.body_len = len - hlen;
  return HeaderError::Ok;
}

// ---- encoding -------------------------------------------------------------

namespace {

void put_item(std::vector<uint8_t> &out, uint16_t id, const uint8_t *d,
              size_t l) {
  put_le16(out, id);
  out.push_back((uint8_t)l);
  out.insert(out.end(), d, d + l);
}

void put_text(std::vector<uint8_t> &out, uint16_t id, const std::string &s,
              size_t pad) {
  std::string v = s;
  if (pad)
    v.resize(pad, ' ');
  put_item(out, id, (const uint8_t *)v.data(), v.size());
}

void put_u32(std::vector<uint8_t> &out, uint16_t id, uint32_t v) {
  std::vector<uint8_t> b;
  put_le32(b, v);
  put_item(out, id, b.data(), b.size());
}

void put_u16(std::vector<uint8_t> &out, uint16_t id, uint16_t v) {
  std::vector<uint8_t> b;
  put_le16(b, v);
  put_item(out, id, b.data(), b.size());
}

void put_u8(std::vector<uint8_t> &out, uint16_t id, uint8_t v) {
  put_item(out, id, &v, 1);
}

struct OptionalWriter {
  std::vector<uint8_t> &out;
  void operator()(const DownloadCountItem &i) {
    put_u32(out, pfh_item::DownloadCount, i.count);
  }
  void operator()(const PriorityItem &i) {
    put_u8(out, pfh_item::Priority, i.priority);
  }
  void operator()(const CompressionItem &i) {
    put_u8(out, pfh_item::CompressionType, i.type);
  }
  void operator()(const BbsTextItem &i) {
    put_u8(out, pfh_item::BbsText, i.flag);
  }
  void operator()(const DescriptionItem &i) {
    put_text(out, pfh_item::Description, i.text, 0);
  }
  void operator()(const ForwardingItem &i) {
    std::string joined;
    for (size_t k = 0; k < i.destinations.size(); k++) {
      if (k)
        joined.push_back(';');
      joined += i.destinations[k];
    }
    put_text(out, pfh_item::Forwarding, joined, 0);
  }
  void operator()(const RawItem &i) {
    put_item(out, i.id, i.data.data(), i.data.size());
  }
};

} // namespace

std::vector<uint8_t> serialize_pfh(const Pfh &h) {
  std::vector<uint8_t> items;
  put_u32(items, pfh_item::FileNumber, h.file_number);
  put_text(items, pfh_item::FileName, h.name, 8);
  put_text(items, pfh_item::FileExt, h.ext, 3);
  put_u32(items, pfh_item::FileSize, h.file_size);
  put_u32(items, pfh_item::CreateTime, h.create_time);
  put_u8(items, pfh_item::FileType, h.file_type);
  put_u16(items, pfh_item::BodyChecksum, h.body_checksum);
  size_t checksum_pos = items.size() + kItemHead;
  put_u8(items, pfh_item::HeaderChecksum, 0);
  size_t offset_pos = items.size() + kItemHead;
  put_u16(items, pfh_item::BodyOffset, 0);
  put_text(items, pfh_item::Source, h.source, 0);
  put_u32(items, pfh_item::UploadTime, h.upload_time);
  put_text(items, pfh_item::Destination, h.destination, 0);
  OptionalWriter w{items};
  for (const auto &it : h.optional)
    std::visit(w, it);
  put_item(items, pfh_item::End, nullptr, 0);

  std::vector<uint8_t> out;
  out.reserve(items.size() + 2);
  out.push_back(kMagic0);
  out.push_back(kMagic1);
  out.insert(out.end(), items.begin(), items.end());
  checksum_pos += 2;
  offset_pos += 2;
  uint16_t hlen = (uint16_t)out.size();
  out[offset_pos] = (uint8_t)(hlen & 0xFF);
  out[offset_pos + 1] = (uint8_t)(hlen >> 8);

  uint8_t sum = 0;
  for (uint8_t b : out)
    sum = (uint8_t)(sum + b);
  out[checksum_pos] = (uint8_t)(0x100 - sum);
  return out;
}

static bool valid_text(const std::string &s, size_t max) {
  if (s.size() > max)
    return false;
  if (!s.empty() && (s.back() == ' ' || s.back() == '\0'))
    return false;
  return true;
}

bool pfh_valid(const Pfh &h) {
  if (h.name.empty() || !valid_text(h.name, 8) || !valid_text(h.ext, 3))
    return false;
  if (!valid_text(h.source, 9) || !valid_text(h.destination, 9))
    return false;
  for (const auto &it : h.optional) {
    if (auto d = std::get_if<DescriptionItem>(&it)) {
      if (d->text.size() > 255)
        return false;
    } else if (auto f = std::get_if<ForwardingItem>(&it)) {
      size_t total = 0;
      for (const auto &dst : f->destinations) {
        if (dst.find(';') != std::string::npos)
          return false;
        total += dst.size() + 1;
      }
      if (f->destinations.empty() || total > 256)
        return false;
    } else if (auto r = std::get_if<RawItem>(&it)) {
      if (r->id <= pfh_item::LastMandatory || find_rule(r->id) ||
          r->data.size() > 255)
        return false;
    }
  }
  return serialize_pfh(h).size() <= 0xFFFF;
}

} // namespace pacsat
