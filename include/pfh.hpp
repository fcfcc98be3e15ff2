#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace pacsat {

enum class HeaderError : uint8_t {
    Ok = 0,
    Truncated,
    BadMagic,
    BadChecksum,
    UnknownMandatoryItem,
    MissingMandatoryItem,
    BadItemLength
};

const char* to_string(HeaderError e);

namespace pfh_item {
constexpr uint16_t End             = 0x00;
constexpr uint16_t FileNumber      = 0x01;
constexpr uint16_t FileName        = 0x02;
constexpr uint16_t FileExt         = 0x03;
constexpr uint16_t FileSize        = 0x04;
constexpr uint16_t CreateTime      = 0x05;
constexpr uint16_t FileType        = 0x08;
constexpr uint16_t BodyChecksum    = 0x09;
constexpr uint16_t HeaderChecksum  = 0x0A;
constexpr uint16_t BodyOffset      = 0x0B;
constexpr uint16_t Source          = 0x10;
constexpr uint16_t UploadTime      = 0x12;
constexpr uint16_t DownloadCount   = 0x13;
constexpr uint16_t Destination     = 0x14;
constexpr uint16_t Priority        = 0x18;
constexpr uint16_t CompressionType = 0x19;
constexpr uint16_t BbsText         = 0x20;
constexpr uint16_t Description     = 0x24;
constexpr uint16_t Forwarding      = 0x2A;
constexpr uint16_t LastMandatory   = 0x0F;
} // namespace pfh_item

struct DownloadCountItem {
    uint32_t count{0};
    bool operator==(const DownloadCountItem& o) const { return count == o.count; }
};
struct PriorityItem {
    uint8_t priority{0};
    bool operator==(const PriorityItem& o) const { return priority == o.priority; }
};
struct CompressionItem {
    uint8_t type{0};
    bool operator==(const CompressionItem& o) const { return type == o.type; }
};
struct BbsTextItem {
    uint8_t flag{0};
    bool operator==(const BbsTextItem& o) const { return flag == o.flag; }
};
struct DescriptionItem {
    std::string text;
    bool operator==(const DescriptionItem& o) const { return text == o.text; }
};
struct ForwardingItem {
    std::vector<std::string> destinations;
    bool operator==(const ForwardingItem& o) const { return destinations == o.destinations; }
};
// Item type this codec does not interpret; carried through unchanged.
struct RawItem {
    uint16_t id{0};
    std::vector<uint8_t> data;
    bool operator==(const RawItem& o) const { return id == o.id && data == o.data; }
};

using PfhItem = std::variant<DownloadCountItem, PriorityItem, CompressionItem, BbsTextItem,
                             DescriptionItem, ForwardingItem, RawItem>;

struct Pfh {
    uint32_t file_number{0};
    std::string name;          // up to 8 characters
    std::string ext;           // up to 3 characters
    uint32_t file_size{0};
    uint32_t create_time{0};
    uint8_t file_type{0};
    uint16_t body_checksum{0};
    std::string source;
    uint32_t upload_time{0};
    std::string destination;
    std::vector<PfhItem> optional;

    std::string filename() const;   // "NAME.EXT"

    template <typename T> const T* find() const {
        for (const auto& it : optional)
            if (auto p = std::get_if<T>(&it))
                return p;
        return nullptr;
    }
    template <typename T> T* find() {
        for (auto& it : optional)
            if (auto p = std::get_if<T>(&it))
                return p;
        return nullptr;
    }
    // Replaces the first item of the same type or appends a new one.
    template <typename T> void set(T item) {
        if (T* p = find<T>())
            *p = std::move(item);
        else
            optional.emplace_back(std::move(item));
    }

    bool operator==(const Pfh& o) const;
    bool operator!=(const Pfh& o) const { return !(*this == o); }
};

// Header plus a view of the bytes that follow it. The body is not copied.
struct PfhView {
    Pfh header;
    size_t header_len{0};
    const uint8_t* body{nullptr};
    size_t body_len{0};
};

// The body offset item is a u16, which bounds the header length.
constexpr size_t kPfhMaxHeader = 0xFFFF;

HeaderError parse_pfh(const uint8_t* data, size_t len, PfhView& out);
std::vector<uint8_t> serialize_pfh(const Pfh& h);

// Additive 16-bit body checksum carried in item 0x09
uint16_t body_checksum(const uint8_t* data, size_t len);
// Field limits checked before serialization: 8.3 name, callsign lengths
bool pfh_valid(const Pfh& h);

} // namespace pacsat
