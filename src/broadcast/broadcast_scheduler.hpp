#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include "ax25.hpp"
#include "hole_list.hpp"
#include "protocol.hpp"

namespace pacsat {

class FileStore;

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

struct BroadcastConfig {
    std::chrono::milliseconds directory_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds tick{100};
    size_t chunk_size{200};
    size_t header_segment{200};
    size_t max_on_demand_per_cycle{32};
    Ax25Address destination{"QST", 1, false};
    Ax25Address source;
};

enum class BroadcastKind : uint8_t { Directory, File };

struct BroadcastQueueEntry {
    uint32_t file_number{0};
    uint8_t priority{0};          // 0 = periodic directory cycle
    uint64_t seq{0};
    BroadcastKind kind{BroadcastKind::Directory};
    // directory entries: serialized header and how much of it went out
    std::vector<uint8_t> header;
    uint32_t header_sent{0};
    uint32_t upload_time{0};
    // file entries: body ranges still to send, front first
    HoleList pending;
    uint32_t file_size{0};
    bool empty_body_sent{false};

    bool periodic() const { return priority == 0; }
    uint32_t cursor() const;
    size_t frames_left(size_t header_segment, size_t chunk_size) const;
};

// Owns the broadcast queue. tick() is called once per transmit slot and
// yields at most one 0xBD or 0xBB frame. On-demand work outranks the
// periodic directory cycle only while the cycle can still finish before its
// deadline.
class BroadcastScheduler {
public:
    BroadcastScheduler(const BroadcastConfig& cfg, FileStore& store);

    bool enqueue_on_demand(uint32_t file_number, uint8_t priority,
                           BroadcastKind kind = BroadcastKind::File);
    bool enqueue_ranges(uint32_t file_number, const std::vector<ByteRange>& ranges,
                        uint8_t priority);

    std::optional<Ax25Frame> tick(SteadyTime now);

    size_t queued() const { return queue_.size(); }
    size_t periodic_frames_owed() const;
    bool cycle_started() const { return cycle_started_; }
    SteadyTime cycle_deadline() const { return deadline_; }
    size_t on_demand_served() const { return on_demand_served_; }
    const BroadcastConfig& config() const { return cfg_; }

private:
    // priority descending, then FIFO
    struct Key {
        uint8_t priority;
        uint64_t seq;
        bool operator<(const Key& o) const {
            if (priority != o.priority)
                return priority > o.priority;
            return seq < o.seq;
        }
    };
    using Queue = std::map<Key, BroadcastQueueEntry>;

    void start_cycle(SteadyTime now);
    bool load_directory(BroadcastQueueEntry& e);
    Queue::iterator find_on_demand(uint32_t file_number, BroadcastKind kind);
    void raise_priority(Queue::iterator it, uint8_t priority);
    bool insert(BroadcastQueueEntry&& e);
    std::optional<Ax25Frame> serve(Queue::iterator it);
    std::optional<Ax25Frame> next_directory_frame(BroadcastQueueEntry& e);
    std::optional<Ax25Frame> next_file_frame(BroadcastQueueEntry& e);

    BroadcastConfig cfg_;
    FileStore& store_;
    Queue queue_;
    uint64_t next_seq_{1};
    bool cycle_started_{false};
    SteadyTime deadline_{};
    size_t on_demand_served_{0};
};

} // namespace pacsat
