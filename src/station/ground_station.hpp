#pragma once
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include "broadcast_scheduler.hpp"
#include "file_store.hpp"
#include "ftl0_engine.hpp"
#include "radio_link.hpp"

namespace pacsat {

struct StationConfig {
    Ax25Address callsign;
    std::string store_root{"./pacsat-store"};
    LinkConfig link;
    BroadcastConfig broadcast;
    Ftl0Config ftl0;
    std::chrono::milliseconds pump_interval{200};
    std::chrono::hours trash_retention{24 * 30};
    std::chrono::seconds cleanup_interval{3600};
    std::chrono::seconds beacon_interval{600};
    std::string beacon_text{"PACSAT ground station"};
};

// Wires the store, scheduler, FTL0 engine and radio link onto one
// io_context and drives them from timers.
class GroundStation : public FrameSink {
public:
    GroundStation(asio::io_context& io, const StationConfig& cfg);
    bool start();
    void stop();
    int exit_code() const { return exit_code_; }

    void send(Ax25Frame&& f) override;

private:
    void dispatch();
    void schedule_tick();
    void schedule_pump();
    void schedule_cleanup();
    void schedule_beacon();
    bool check_fatal();

    asio::io_context& io_;
    StationConfig cfg_;
    FileStore store_;
    BroadcastScheduler scheduler_;
    std::shared_ptr<RadioLink> link_;
    Ftl0Engine engine_;
    asio::steady_timer tick_timer_;
    asio::steady_timer pump_timer_;
    asio::steady_timer cleanup_timer_;
    asio::steady_timer beacon_timer_;
    asio::signal_set signals_;
    bool dispatch_posted_{false};
    int exit_code_{0};
};

} // namespace pacsat
