#pragma once
#include <cstdint>
#include <vector>
#include "link_codec.hpp"

namespace pacsat {

constexpr uint8_t KISS_FEND  = 0xC0;
constexpr uint8_t KISS_FESC  = 0xDB;
constexpr uint8_t KISS_TFEND = 0xDC;
constexpr uint8_t KISS_TFESC = 0xDD;

enum class KissCommand : uint8_t {
    DataFrame   = 0x00,
    TxDelay     = 0x01,
    Persistence = 0x02,
    SlotTime    = 0x03,
    TxTail      = 0x04,
    FullDuplex  = 0x05,
    SetHardware = 0x06,
    AckMode     = 0x0C,   // XKISS
    Poll        = 0x0E,   // XKISS
    Return      = 0xFF
};

struct KissOptions {
    bool extended{false};     // XKISS multi-drop
    bool checksum{false};     // XKISS checksum mode
    uint8_t port{0};
    bool fcs{true};
    size_t max_frame{1024};
    size_t max_info{kAx25DefaultMaxInfo};
};

class KissCodec : public LinkCodec {
public:
    explicit KissCodec(const KissOptions& opt) : opt_(opt) {}
    void feed(const uint8_t* data, size_t len, std::vector<LinkEvent>& out) override;
    FrameError encode(const Ax25Frame& f, std::vector<uint8_t>& out) override;
    std::vector<uint8_t> login() override { return {}; }
    void reset() override;

    std::vector<uint8_t> encode_command(KissCommand cmd, uint8_t value) const;
    std::vector<uint8_t> encode_poll() const;
    // Escapes and delimits an already-built KISS frame (command byte first).
    std::vector<uint8_t> wrap(const std::vector<uint8_t>& raw) const;

private:
    void finish_frame(std::vector<LinkEvent>& out);
    void fail(FrameError e, std::vector<LinkEvent>& out);

    KissOptions opt_;
    std::vector<uint8_t> buffer_;
    bool in_frame_{false};
    bool escape_{false};
};

} // namespace pacsat
