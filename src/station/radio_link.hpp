#pragma once
#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include "agwpe.hpp"
#include "kiss.hpp"
#include "link_codec.hpp"

namespace pacsat {

enum class TransportKind { KissSerial, KissTcp, Agwpe };

bool parse_transport(const std::string& s, TransportKind& out);

struct LinkConfig {
    TransportKind kind{TransportKind::KissTcp};
    std::string device{"/dev/ttyUSB0"};
    unsigned baud{9600};
    std::string host{"127.0.0.1"};
    uint16_t port{8001};
    KissOptions kiss;
    AgwpeOptions agwpe;
    size_t rx_queue{64};
    size_t tx_queue{256};
};

// One radio transport: a serial port or a TCP socket carrying KISS, or a
// TCP socket to an AGWPE server. Decoded events land in a bounded channel
// that never holds more than rx_queue events; while it is full undecoded
// bytes are held back and the link stops reading. Transmission is single-writer
// with at most one write in flight.
class RadioLink : public std::enable_shared_from_this<RadioLink> {
public:
    using tcp = asio::ip::tcp;

    RadioLink(asio::io_context& io, const LinkConfig& cfg);
    void start();
    void stop();

    // Called after events are pushed into the channel.
    void on_readable(std::function<void()> cb) { readable_ = std::move(cb); }
    bool pop(LinkEvent& out);
    size_t pending() const { return rx_q_.size(); }
    // Restarts reading if the channel had filled up.
    void resume_read();

    void send(const Ax25Frame& f);
    bool connected() const { return connected_; }
    bool tx_idle() const { return connected_ && write_q_.empty(); }

private:
    void connect();
    void open_serial();
    void connect_tcp();
    void on_connected();
    void reconnect();
    void do_read();
    void do_write();
    void handle_bytes(const uint8_t* data, size_t n);
    void enqueue(std::vector<uint8_t>&& bytes);

    asio::io_context& io_;
    LinkConfig cfg_;
    std::unique_ptr<LinkCodec> codec_;
    asio::serial_port serial_;
    tcp::socket sock_;
    asio::steady_timer retry_timer_;
    std::vector<uint8_t> read_buf_;
    std::deque<LinkEvent> rx_q_;
    std::vector<uint8_t> held_;    // read but not yet decoded
    std::deque<std::vector<uint8_t>> write_q_;
    std::function<void()> readable_;
    bool connected_{false};
    bool reading_{false};
    bool writing_{false};
    bool stopped_{false};
};

} // namespace pacsat
