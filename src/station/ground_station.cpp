#include "ground_station.hpp"
#include "logging.hpp"
#include <csignal>

namespace pacsat {

GroundStation::GroundStation(asio::io_context &io, const StationConfig &cfg)
    : io_(io), cfg_(cfg), store_(cfg.store_root),
      scheduler_(cfg.broadcast, store_),
      link_(std::make_shared<RadioLink>(io, cfg.link)),
      engine_(cfg.ftl0, store_, scheduler_, *this), tick_timer_(io),
      pump_timer_(io), cleanup_timer_(io), beacon_timer_(io),
      signals_(io, SIGINT, SIGTERM) {}

bool GroundStation::start() {
  StoreError e = store_.open();
  if (e != StoreError::Ok) {
    Logger::instance().log(LogLevel::ERROR, "station: cannot open store %s: %s",
                           cfg_.store_root.c_str(), to_string(e));
    exit_code_ = e == StoreError::Exhausted ? 2 : 1;
    return false;
  }
  signals_.async_wait([this](std::error_code ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "station: signal %d, shutting down",
                           sig);
    stop();
  });

  link_->on_readable([this]() {
    if (dispatch_posted_)
      return;
    dispatch_posted_ = true;
    asio::post(io_, [this]() { dispatch(); });
  });
  link_->start();

  schedule_tick();
  schedule_pump();
  schedule_cleanup();
  if (cfg_.beacon_interval.count() > 0)
    schedule_beacon();
  Logger::instance().log(LogLevel::INFO, "station: %s up, store %s",
                         cfg_.callsign.to_string().c_str(),
                         cfg_.store_root.c_str());
  return true;
}

void GroundStation::stop() {
  std::error_code ec;
  tick_timer_.cancel();
  pump_timer_.cancel();
  cleanup_timer_.cancel();
  beacon_timer_.cancel();
  signals_.cancel(ec);
  link_->stop();
  io_.stop();
}

bool GroundStation::check_fatal() {
  if (engine_.fatal_error() == StoreError::Ok)
    return false;
  Logger::instance().log(LogLevel::ERROR,
                         "station: %s, stopping for operator intervention",
                         to_string(engine_.fatal_error()));
  exit_code_ = 2;
  stop();
  return true;
}

void GroundStation::send(Ax25Frame &&f) { link_->send(f); }

// One frame per run so reading and dispatch interleave on the loop.
void GroundStation::dispatch() {
  dispatch_posted_ = false;
  LinkEvent ev;
  if (!link_->pop(ev))
    return;
  if (ev.kind == LinkEvent::Kind::Frame)
    engine_.handle_frame(ev.frame, SteadyClock::now());
  else if (ev.kind == LinkEvent::Kind::Poll)
    Logger::instance().log(LogLevel::TRACE, "station: poll on port %u",
                           (unsigned)ev.port);
  if (check_fatal())
    return;
  link_->resume_read();
  if (link_->pending() > 0 && !dispatch_posted_) {
    dispatch_posted_ = true;
    asio::post(io_, [this]() { dispatch(); });
  }
}

void GroundStation::schedule_tick() {
  tick_timer_.expires_after(cfg_.broadcast.tick);
  tick_timer_.async_wait([this](std::error_code ec) {
    if (ec)
      return;
    if (link_->tx_idle()) {
      auto f = scheduler_.tick(SteadyClock::now());
      if (f)
        link_->send(*f);
    }
    schedule_tick();
  });
}

void GroundStation::schedule_pump() {
  pump_timer_.expires_after(cfg_.pump_interval);
  pump_timer_.async_wait([this](std::error_code ec) {
    if (ec)
      return;
    engine_.pump(SteadyClock::now());
    if (check_fatal())
      return;
    schedule_pump();
  });
}

void GroundStation::schedule_cleanup() {
  cleanup_timer_.expires_after(cfg_.cleanup_interval);
  cleanup_timer_.async_wait([this](std::error_code ec) {
    if (ec)
      return;
    size_t n = store_.purge_expired_trash(
        std::chrono::duration_cast<std::chrono::seconds>(cfg_.trash_retention));
    if (n > 0)
      Logger::instance().log(LogLevel::INFO,
                             "station: purged %zu expired trash entries", n);
    schedule_cleanup();
  });
}

void GroundStation::schedule_beacon() {
  beacon_timer_.expires_after(cfg_.beacon_interval);
  beacon_timer_.async_wait([this](std::error_code ec) {
    if (ec)
      return;
    Ax25Address to{"BEACON", 0, false};
    std::vector<uint8_t> text(cfg_.beacon_text.begin(), cfg_.beacon_text.end());
    link_->send(Ax25Frame::ui(to, cfg_.callsign, kPidFtl0, std::move(text)));
    schedule_beacon();
  });
}

} // namespace pacsat
