#pragma once
#include <cstdint>
#include <vector>
#include "ax25.hpp"

namespace pacsat {

struct LinkEvent {
    enum class Kind : uint8_t { Frame, Poll, Error };
    Kind kind{Kind::Frame};
    FrameError error{FrameError::Ok};
    uint8_t port{0};
    bool ack_mode{false};
    uint16_t ack_id{0};
    Ax25Frame frame;
};

// Converts between a transport byte stream and AX.25 frames. KISS/XKISS over
// a serial line or TCP and AGWPE over TCP all sit behind this interface.
class LinkCodec {
public:
    virtual ~LinkCodec() = default;
    // Appends every event completed by these bytes, in arrival order.
    virtual void feed(const uint8_t* data, size_t len, std::vector<LinkEvent>& out) = 0;
    virtual FrameError encode(const Ax25Frame& f, std::vector<uint8_t>& out) = 0;
    // Bytes to send once after the transport connects.
    virtual std::vector<uint8_t> login() = 0;
    virtual void reset() = 0;
};

} // namespace pacsat
