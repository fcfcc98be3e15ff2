#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace pacsat {

enum class FrameError : uint8_t {
    Ok = 0,
    Desync,
    BadFcs,
    BadChecksum,
    MalformedAddress,
    TooShort,
    Oversize,
    UnknownCommand
};

const char* to_string(FrameError e);

constexpr size_t kAx25MaxDigipeaters = 8;
constexpr size_t kAx25DefaultMaxInfo = 256;

struct Ax25Address {
    std::string callsign;   // 1..6 of A-Z 0-9
    uint8_t ssid{0};        // 0..15
    bool flag{false};       // C bit (dest/src) or H bit (digipeater)

    std::string to_string() const;
    bool operator==(const Ax25Address& o) const {
        return callsign == o.callsign && ssid == o.ssid;
    }
    bool operator!=(const Ax25Address& o) const { return !(*this == o); }
};

// Parses "CALL" or "CALL-SSID"; upper-cases the call.
bool parse_address(const std::string& text, Ax25Address& out);

struct Ax25Frame {
    Ax25Address destination;
    Ax25Address source;
    std::vector<Ax25Address> digipeaters;
    uint8_t control{0x03};
    uint8_t pid{0xF0};
    std::vector<uint8_t> info;

    bool is_ui() const { return (control & 0xEF) == 0x03; }
    bool has_pid() const { return is_ui() || (control & 0x01) == 0; }

    static Ax25Frame ui(const Ax25Address& dst, const Ax25Address& src, uint8_t pid,
                        std::vector<uint8_t> info);
};

// Serializes the frame, optionally appending the FCS (little-endian).
FrameError encode_ax25(const Ax25Frame& f, bool with_fcs, std::vector<uint8_t>& out,
                       size_t max_info = kAx25DefaultMaxInfo);
FrameError decode_ax25(const uint8_t* data, size_t len, bool with_fcs, Ax25Frame& out,
                       size_t max_info = kAx25DefaultMaxInfo);

} // namespace pacsat
