#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "link_codec.hpp"

namespace pacsat {

constexpr size_t kAgwpeHeaderLen = 36;
constexpr uint16_t kAgwpeDefaultPort = 8000;

struct AgwpeHeader {
    uint8_t port{0};
    char data_kind{0};
    uint8_t pid{0};
    std::string call_from;
    std::string call_to;
    uint32_t data_len{0};
    uint32_t user{0};
};

std::vector<uint8_t> encode_agwpe(const AgwpeHeader& h, const std::vector<uint8_t>& data);
void decode_agwpe_header(const uint8_t* p, AgwpeHeader& out);

struct AgwpeOptions {
    uint8_t port{0};
    std::string callsign;
    uint32_t max_data{4096};
    size_t max_info{kAx25DefaultMaxInfo};
};

// AGWPE TCP API: AX.25 frames travel as raw 'K' frames without FCS.
class AgwpeCodec : public LinkCodec {
public:
    explicit AgwpeCodec(const AgwpeOptions& opt) : opt_(opt) {}
    void feed(const uint8_t* data, size_t len, std::vector<LinkEvent>& out) override;
    FrameError encode(const Ax25Frame& f, std::vector<uint8_t>& out) override;
    std::vector<uint8_t> login() override;
    void reset() override { inbuf_.clear(); }

private:
    AgwpeOptions opt_;
    std::vector<uint8_t> inbuf_;
};

} // namespace pacsat
