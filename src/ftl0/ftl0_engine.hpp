#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "ax25.hpp"
#include "broadcast_scheduler.hpp"
#include "file_store.hpp"
#include "ftl0.hpp"

namespace pacsat {

// Where the engine hands outbound frames. The station's transmit queue
// implements it; tests record into a vector.
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void send(Ax25Frame&& f) = 0;
};

struct Ftl0Config {
    Ax25Address callsign;
    std::chrono::milliseconds transfer_timeout{std::chrono::seconds(120)};
    std::chrono::milliseconds hole_report_interval{std::chrono::seconds(10)};
    uint32_t max_upload{4 * 1024 * 1024};
    size_t chunk_size{200};
    size_t header_segment{200};
    size_t burst{4};              // download frames per pump per session
    size_t max_sessions{32};
    uint8_t broadcast_priority{1};
};

enum class UploadState : uint8_t { ReceivingHeader, ReceivingBody };
enum class DownloadState : uint8_t { SendingDirectory, SendingChunks, AwaitingAck, Retransmit };

// FTL0 upload/download state machine, one session per remote callsign and
// file number. All methods take the current time explicitly.
class Ftl0Engine {
public:
    Ftl0Engine(const Ftl0Config& cfg, FileStore& store, BroadcastScheduler& scheduler,
               FrameSink& sink);

    void handle_frame(const Ax25Frame& f, SteadyTime now);
    // Sends download bursts and hole reports, expires idle sessions.
    void pump(SteadyTime now);

    size_t upload_sessions() const { return uploads_.size(); }
    size_t download_sessions() const { return downloads_.size(); }
    bool upload_state(const std::string& remote, uint32_t file_number, UploadState& out) const;
    bool download_state(const std::string& remote, uint32_t file_number,
                        DownloadState& out) const;
    // Set once the store reports resource exhaustion.
    StoreError fatal_error() const { return fatal_; }

private:
    using SessionKey = std::pair<std::string, uint32_t>;

    struct Upload {
        Ax25Address remote;
        uint32_t file_number{0};
        uint32_t length{0};
        TransferHandle handle{0};
        UploadState state{UploadState::ReceivingHeader};
        bool dirty{false};
        SteadyTime last_activity;
        SteadyTime last_report;
    };

    struct Download {
        Ax25Address remote;
        uint32_t file_number{0};
        DownloadState state{DownloadState::SendingDirectory};
        std::vector<uint8_t> header;
        uint32_t header_sent{0};
        uint32_t file_size{0};
        HoleList ranges;
        SteadyTime last_activity;
    };

    void on_upload_cmd(const Ax25Address& remote, const Ftl0Packet& p, SteadyTime now);
    void on_data(const Ax25Address& remote, const Ftl0Packet& p, SteadyTime now);
    void on_data_end(const Ax25Address& remote, const Ftl0Packet& p, SteadyTime now);
    void on_dl_request(const Ax25Address& remote, const Ftl0Packet& p, SteadyTime now);
    void on_dl_ack(const Ax25Address& remote, const Ftl0Packet& p);
    void check_header(Upload& u);
    void finish_upload(std::map<SessionKey, Upload>::iterator it, StoreError err,
                       const ChunkOutcome& oc, SteadyTime now);
    void drop_upload(std::map<SessionKey, Upload>::iterator it);
    bool pump_download(Download& d);

    void reply(const Ax25Address& to, const Ftl0Packet& p);
    void reply_error(const Ax25Address& to, ProtocolError e);
    void reply_nak(const Ax25Address& to, uint32_t file_number, ProtocolError e);
    void reply_holes(const Ax25Address& to, Ftl0Type type, uint32_t file_number,
                     const HoleList& holes);
    void send_ui(const Ax25Address& to, uint8_t pid, std::vector<uint8_t> info);
    bool store_ok(StoreError e);
    size_t session_count() const { return uploads_.size() + downloads_.size(); }

    Ftl0Config cfg_;
    FileStore& store_;
    BroadcastScheduler& scheduler_;
    FrameSink& sink_;
    std::map<SessionKey, Upload> uploads_;
    std::map<SessionKey, Download> downloads_;
    std::map<SessionKey, SteadyTime> completed_;
    StoreError fatal_{StoreError::Ok};
};

} // namespace pacsat
