#include "radio_link.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace pacsat {

bool parse_transport(const std::string &s, TransportKind &out) {
  if (s == "kiss-serial")
    out = TransportKind::KissSerial;
  else if (s == "kiss-tcp")
    out = TransportKind::KissTcp;
  else if (s == "agwpe")
    out = TransportKind::Agwpe;
  else
    return false;
  return true;
}

RadioLink::RadioLink(asio::io_context &io, const LinkConfig &cfg)
    : io_(io), cfg_(cfg), serial_(io), sock_(io), retry_timer_(io),
      read_buf_(4096) {
  if (cfg_.kind == TransportKind::Agwpe)
    codec_.reset(new AgwpeCodec(cfg_.agwpe));
  else
    codec_.reset(new KissCodec(cfg_.kiss));
  if (cfg_.rx_queue == 0)
    cfg_.rx_queue = 1;
}

void RadioLink::start() { connect(); }

void RadioLink::stop() {
  stopped_ = true;
  connected_ = false;
  retry_timer_.cancel();
  std::error_code ec;
  if (serial_.is_open())
    serial_.close(ec);
  if (sock_.is_open())
    sock_.close(ec);
}

void RadioLink::connect() {
  if (stopped_)
    return;
  if (cfg_.kind == TransportKind::KissSerial)
    open_serial();
  else
    connect_tcp();
}

void RadioLink::open_serial() {
  std::error_code ec;
  serial_.open(cfg_.device, ec);
  if (!ec)
    serial_.set_option(asio::serial_port_base::baud_rate(cfg_.baud), ec);
  if (!ec)
    serial_.set_option(asio::serial_port_base::character_size(8), ec);
  if (!ec)
    serial_.set_option(
        asio::serial_port_base::parity(asio::serial_port_base::parity::none),
        ec);
  if (!ec)
    serial_.set_option(asio::serial_port_base::stop_bits(
                           asio::serial_port_base::stop_bits::one),
                       ec);
  if (!ec)
    serial_.set_option(asio::serial_port_base::flow_control(
                           asio::serial_port_base::flow_control::none),
                       ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "link: open %s failed: %s",
                           cfg_.device.c_str(), ec.message().c_str());
    reconnect();
    return;
  }
  Logger::instance().log(LogLevel::INFO, "link: %s open at %u baud",
                         cfg_.device.c_str(), cfg_.baud);
  on_connected();
}

void RadioLink::connect_tcp() {
  auto self = shared_from_this();
  auto resolver = std::make_shared<tcp::resolver>(io_);
  resolver->async_resolve(
      cfg_.host, std::to_string(cfg_.port),
      [this, self, resolver](std::error_code ec,
                             tcp::resolver::results_type res) {
        if (ec) {
          Logger::instance().log(LogLevel::WARN, "link: resolve %s failed: %s",
                                 cfg_.host.c_str(), ec.message().c_str());
          reconnect();
          return;
        }
        asio::async_connect(
            sock_, res, [this, self](std::error_code ec, const tcp::endpoint &) {
              if (ec) {
                Logger::instance().log(LogLevel::WARN,
                                       "link: connect %s:%u failed: %s",
                                       cfg_.host.c_str(), (unsigned)cfg_.port,
                                       ec.message().c_str());
                reconnect();
                return;
              }
              Logger::instance().log(LogLevel::INFO, "link: connected to %s:%u",
                                     cfg_.host.c_str(), (unsigned)cfg_.port);
              on_connected();
            });
      });
}

void RadioLink::on_connected() {
  connected_ = true;
  codec_->reset();
  held_.clear();
  std::vector<uint8_t> login = codec_->login();
  if (!login.empty())
    write_q_.emplace_front(std::move(login));
  do_read();
  do_write();
}

void RadioLink::reconnect() {
  connected_ = false;
  reading_ = false;
  writing_ = false;
  std::error_code ec;
  if (serial_.is_open())
    serial_.close(ec);
  if (sock_.is_open())
    sock_.close(ec);
  if (stopped_)
    return;
  auto self = shared_from_this();
  retry_timer_.expires_after(std::chrono::seconds(1));
  retry_timer_.async_wait([this, self](std::error_code ec) {
    if (ec)
      return;
    connect();
  });
}

void RadioLink::do_read() {
  if (!connected_ || reading_ || !held_.empty() ||
      rx_q_.size() >= cfg_.rx_queue)
    return;
  reading_ = true;
  auto self = shared_from_this();
  auto handler = [this, self](std::error_code ec, std::size_t n) {
    reading_ = false;
    if (ec) {
      if (stopped_ || ec == asio::error::operation_aborted)
        return;
      Logger::instance().log(LogLevel::WARN, "link: read error: %s",
                             ec.message().c_str());
      reconnect();
      return;
    }
    if (Logger::instance().enabled(LogLevel::TRACE))
      Logger::instance().log(LogLevel::TRACE, "link: rx %s",
                             bytes_to_hex(read_buf_.data(), n).c_str());
    handle_bytes(read_buf_.data(), n);
    do_read();
  };
  if (cfg_.kind == TransportKind::KissSerial)
    serial_.async_read_some(asio::buffer(read_buf_), handler);
  else
    sock_.async_read_some(asio::buffer(read_buf_), handler);
}

// Feeds the codec a byte at a time and stops once the channel is full.
// Whatever is left waits in held_ until the consumer makes room.
void RadioLink::handle_bytes(const uint8_t *data, size_t n) {
  std::vector<LinkEvent> events;
  size_t frames = 0;
  size_t used = 0;
  while (used < n && rx_q_.size() < cfg_.rx_queue) {
    codec_->feed(data + used, 1, events);
    used++;
    for (auto &ev : events) {
      if (ev.kind == LinkEvent::Kind::Error) {
        Logger::instance().log(LogLevel::WARN, "link: %s", to_string(ev.error));
        continue;
      }
      rx_q_.push_back(std::move(ev));
      frames++;
    }
    events.clear();
  }
  if (used < n) {
    held_.assign(data + used, data + n);
    Logger::instance().log(LogLevel::DEBUG,
                           "link: receive channel full, holding %zu bytes",
                           held_.size());
  }
  if (frames > 0 && readable_)
    readable_();
}

bool RadioLink::pop(LinkEvent &out) {
  if (rx_q_.empty())
    return false;
  out = std::move(rx_q_.front());
  rx_q_.pop_front();
  return true;
}

void RadioLink::resume_read() {
  if (!held_.empty() && rx_q_.size() < cfg_.rx_queue) {
    std::vector<uint8_t> bytes;
    bytes.swap(held_);
    handle_bytes(bytes.data(), bytes.size());
  }
  if (!reading_)
    do_read();
}

void RadioLink::enqueue(std::vector<uint8_t> &&bytes) {
  if (write_q_.size() >= cfg_.tx_queue) {
    Logger::instance().log(LogLevel::WARN,
                           "link: transmit queue full, oldest frame dropped");
    if (writing_ && write_q_.size() > 1)
      write_q_.erase(write_q_.begin() + 1);
    else if (!writing_)
      write_q_.pop_front();
  }
  write_q_.emplace_back(std::move(bytes));
  do_write();
}

void RadioLink::send(const Ax25Frame &f) {
  std::vector<uint8_t> bytes;
  FrameError e = codec_->encode(f, bytes);
  if (e != FrameError::Ok) {
    Logger::instance().log(LogLevel::ERROR, "link: cannot encode frame to %s: %s",
                           f.destination.to_string().c_str(), to_string(e));
    return;
  }
  if (Logger::instance().enabled(LogLevel::TRACE))
    Logger::instance().log(LogLevel::TRACE, "link: tx %s",
                           bytes_to_hex(bytes.data(), bytes.size()).c_str());
  enqueue(std::move(bytes));
}

void RadioLink::do_write() {
  if (!connected_ || writing_ || write_q_.empty())
    return;
  writing_ = true;
  auto self = shared_from_this();
  auto handler = [this, self](std::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
      if (stopped_ || ec == asio::error::operation_aborted)
        return;
      Logger::instance().log(LogLevel::WARN, "link: write error: %s",
                             ec.message().c_str());
      reconnect();
      return;
    }
    write_q_.pop_front();
    do_write();
  };
  auto &front = write_q_.front();
  if (cfg_.kind == TransportKind::KissSerial)
    asio::async_write(serial_, asio::buffer(front), handler);
  else
    asio::async_write(sock_, asio::buffer(front), handler);
}

} // namespace pacsat
