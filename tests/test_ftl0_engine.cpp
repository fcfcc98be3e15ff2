#include <gtest/gtest.h>
#include <algorithm>
#include "ftl0_engine.hpp"
#include "test_support.hpp"

using namespace pacsat;
using namespace pacsat::testing_support;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

class RecordingSink : public FrameSink {
public:
    void send(Ax25Frame&& f) override { frames.push_back(std::move(f)); }
    std::vector<Ax25Frame> frames;
};

} // namespace

class Ftl0EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.reset(new FileStore(dir_.str()));
        ASSERT_EQ(StoreError::Ok, store_->open());
        ASSERT_TRUE(parse_address("W1GND", station_));
        ASSERT_TRUE(parse_address("K1ABC-1", remote_));
        scheduler_.reset(new BroadcastScheduler(BroadcastConfig{}, *store_));
        cfg_.callsign = station_;
        cfg_.burst = 100;
        cfg_.chunk_size = 64;
        cfg_.max_upload = 4096;
        make_engine();
    }

    void make_engine() { engine_.reset(new Ftl0Engine(cfg_, *store_, *scheduler_, sink_)); }

    void send(const Ftl0Packet& p) {
        std::vector<uint8_t> bytes;
        ASSERT_TRUE(encode_ftl0(p, bytes));
        send_raw(bytes);
    }

    void send_raw(const std::vector<uint8_t>& info, uint8_t pid = kPidFtl0) {
        engine_->handle_frame(Ax25Frame::ui(station_, remote_, pid, info), now_);
    }

    void send_data(uint32_t file_number, const std::vector<uint8_t>& blob, uint32_t offset,
                   size_t len) {
        Ftl0Packet p;
        p.type = Ftl0Type::Data;
        p.file_number = file_number;
        p.offset = offset;
        p.data.assign(blob.begin() + offset, blob.begin() + offset + len);
        send(p);
    }

    // Decodes and clears everything the engine sent.
    std::vector<Ftl0Packet> replies() {
        std::vector<Ftl0Packet> out;
        for (const auto& f : sink_.frames) {
            EXPECT_EQ(remote_, f.destination);
            EXPECT_EQ(station_, f.source);
            if (f.pid != kPidFtl0)
                continue;
            Ftl0Packet p;
            EXPECT_EQ(ProtocolError::Ok, decode_ftl0(f.info.data(), f.info.size(), p));
            out.push_back(p);
        }
        sink_.frames.clear();
        return out;
    }

    ProtocolError single_error() {
        std::vector<Ftl0Packet> r = replies();
        if (r.size() != 1 || r[0].type != Ftl0Type::UlErrorResp)
            return ProtocolError::Ok;
        return r[0].error;
    }

    uint32_t start_upload(uint32_t length) {
        Ftl0Packet cmd;
        cmd.type = Ftl0Type::UploadCmd;
        cmd.length = length;
        send(cmd);
        std::vector<Ftl0Packet> r = replies();
        EXPECT_EQ(1u, r.size());
        if (r.size() != 1)
            return 0;
        EXPECT_EQ(Ftl0Type::UlGoResp, r[0].type);
        EXPECT_EQ((std::vector<ByteRange>{ByteRange{0, length}}), r[0].holes);
        return r[0].file_number;
    }

    std::vector<uint8_t> make_blob(size_t body_len, const std::string& source = "W9FAKE") {
        std::vector<uint8_t> body = pattern(body_len, 9);
        return upload_blob(sample_header("REPORT", source, body), body);
    }

    uint32_t stored_file(size_t size) {
        std::vector<uint8_t> body = pattern(size, 4);
        uint32_t n = 0;
        EXPECT_EQ(StoreError::Ok, store_->store_file(sample_header("GET", "K1ABC", body), body, n));
        return n;
    }

    void request(uint32_t file_number, std::vector<ByteRange> holes = {}, uint8_t flags = 0) {
        Ftl0Packet p;
        p.type = Ftl0Type::DlRequest;
        p.file_number = file_number;
        p.flags = flags;
        p.holes = std::move(holes);
        send(p);
    }

    void simple(Ftl0Type type, uint32_t file_number) {
        Ftl0Packet p;
        p.type = type;
        p.file_number = file_number;
        send(p);
    }

    ScratchDir dir_;
    std::unique_ptr<FileStore> store_;
    std::unique_ptr<BroadcastScheduler> scheduler_;
    std::unique_ptr<Ftl0Engine> engine_;
    RecordingSink sink_;
    Ftl0Config cfg_;
    Ax25Address station_;
    Ax25Address remote_;
    SteadyTime now_{SteadyClock::now()};
};

TEST_F(Ftl0EngineTest, UploadOutOfOrderEndsInAck) {
    std::vector<uint8_t> blob = make_blob(300);
    uint32_t n = start_upload((uint32_t)blob.size());
    ASSERT_NE(0u, n);
    UploadState st;
    ASSERT_TRUE(engine_->upload_state("K1ABC-1", n, st));
    EXPECT_EQ(UploadState::ReceivingHeader, st);

    send_data(n, blob, 0, 64);
    ASSERT_TRUE(engine_->upload_state("K1ABC-1", n, st));
    EXPECT_EQ(UploadState::ReceivingHeader, st);
    send_data(n, blob, 64, 64);
    ASSERT_TRUE(engine_->upload_state("K1ABC-1", n, st));
    EXPECT_EQ(UploadState::ReceivingBody, st);

    size_t last = (blob.size() - 1) / 64 * 64;
    for (size_t off = last; off >= 128; off -= 64)
        send_data(n, blob, (uint32_t)off, std::min<size_t>(64, blob.size() - off));
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::UlAckResp, r[0].type);
    EXPECT_EQ(n, r[0].file_number);
    EXPECT_EQ(0u, engine_->upload_sessions());

    FileMetadata meta;
    ASSERT_EQ(StoreError::Ok, store_->metadata(n, meta));
    EXPECT_EQ("K1ABC", meta.source);
    EXPECT_EQ("REPORT.TXT", meta.filename);
    EXPECT_EQ(300u, meta.size);

    // a late duplicate is ignored, DATA_END is answered with the ACK again
    send_data(n, blob, 0, 64);
    EXPECT_TRUE(replies().empty());
    simple(Ftl0Type::DataEnd, n);
    r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::UlAckResp, r[0].type);
}

TEST_F(Ftl0EngineTest, DataEndReportsHoles) {
    std::vector<uint8_t> blob = make_blob(300);
    uint32_t n = start_upload((uint32_t)blob.size());
    send_data(n, blob, 64, 64);
    simple(Ftl0Type::DataEnd, n);
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::HoleList, r[0].type);
    EXPECT_EQ((std::vector<ByteRange>{ByteRange{0, 64}, ByteRange{128, (uint32_t)blob.size()}}),
              r[0].holes);
}

TEST_F(Ftl0EngineTest, ContinueResumesUpload) {
    std::vector<uint8_t> blob = make_blob(200);
    uint32_t n = start_upload((uint32_t)blob.size());
    send_data(n, blob, 0, 64);

    Ftl0Packet cmd;
    cmd.type = Ftl0Type::UploadCmd;
    cmd.file_number = n;
    cmd.length = (uint32_t)blob.size();
    send(cmd);
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::UlGoResp, r[0].type);
    EXPECT_EQ((std::vector<ByteRange>{ByteRange{64, (uint32_t)blob.size()}}), r[0].holes);

    cmd.file_number = n + 77;
    send(cmd);
    EXPECT_EQ(ProtocolError::NoSuchSession, single_error());
}

TEST_F(Ftl0EngineTest, BadMagicRejectsHeader) {
    std::vector<uint8_t> blob = make_blob(200);
    blob[0] = 0x00;
    uint32_t n = start_upload((uint32_t)blob.size());
    send_data(n, blob, 0, 64);
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::UlNakResp, r[0].type);
    EXPECT_EQ(ProtocolError::HeaderRejected, r[0].error);
    EXPECT_EQ(0u, engine_->upload_sessions());
    EXPECT_EQ(0u, store_->stats().pending_transfers);
}

TEST_F(Ftl0EngineTest, DeclaredLengthMustMatchHeader) {
    std::vector<uint8_t> blob = make_blob(200);
    blob.resize(blob.size() + 10, 0);
    uint32_t n = start_upload((uint32_t)blob.size());
    send_data(n, blob, 0, 64);
    EXPECT_TRUE(replies().empty());
    send_data(n, blob, 64, 64);
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::UlNakResp, r[0].type);
    EXPECT_EQ(ProtocolError::HeaderRejected, r[0].error);
}

TEST_F(Ftl0EngineTest, EndlessHeaderIsRejected) {
    cfg_.max_upload = 100000;
    make_engine();
    // optional items forever, no terminator
    std::vector<uint8_t> blob = {0xAA, 0x55};
    while (blob.size() < 70000) {
        blob.insert(blob.end(), {0x30, 0x00, 0xFF});
        blob.insert(blob.end(), 255, 0);
    }
    blob.resize(70000);
    uint32_t n = start_upload((uint32_t)blob.size());
    ASSERT_NE(0u, n);
    std::vector<Ftl0Packet> r;
    size_t offset = 0;
    while (r.empty() && offset < blob.size()) {
        size_t len = std::min<size_t>(2000, blob.size() - offset);
        send_data(n, blob, (uint32_t)offset, len);
        offset += len;
        r = replies();
    }
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::UlNakResp, r[0].type);
    EXPECT_EQ(ProtocolError::HeaderRejected, r[0].error);
    // decided as soon as the header could no longer fit its u16 offset
    EXPECT_LE(offset, kPfhMaxHeader + 2000u);
    EXPECT_EQ(0u, engine_->upload_sessions());
}

TEST_F(Ftl0EngineTest, CorruptBodyIsNaked) {
    std::vector<uint8_t> blob = make_blob(100);
    blob.back() ^= 0x33;
    uint32_t n = start_upload((uint32_t)blob.size());
    for (size_t off = 0; off < blob.size(); off += 64)
        send_data(n, blob, (uint32_t)off, std::min<size_t>(64, blob.size() - off));
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::UlNakResp, r[0].type);
    EXPECT_EQ(ProtocolError::BodyRejected, r[0].error);
    EXPECT_FALSE(store_->is_active(n));
}

TEST_F(Ftl0EngineTest, BadChunkCrcIsDroppedSilently) {
    std::vector<uint8_t> blob = make_blob(100);
    uint32_t n = start_upload((uint32_t)blob.size());
    Ftl0Packet p;
    p.type = Ftl0Type::Data;
    p.file_number = n;
    p.data.assign(blob.begin(), blob.begin() + 64);
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(encode_ftl0(p, bytes));
    bytes.back() ^= 0x01;
    send_raw(bytes);
    EXPECT_TRUE(replies().empty());

    simple(Ftl0Type::DataEnd, n);
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ((std::vector<ByteRange>{ByteRange{0, (uint32_t)blob.size()}}), r[0].holes);
}

TEST_F(Ftl0EngineTest, UploadLengthLimits) {
    Ftl0Packet cmd;
    cmd.type = Ftl0Type::UploadCmd;
    cmd.length = 0;
    send(cmd);
    EXPECT_EQ(ProtocolError::FileTooLarge, single_error());
    cmd.length = cfg_.max_upload + 1;
    send(cmd);
    EXPECT_EQ(ProtocolError::FileTooLarge, single_error());
    EXPECT_EQ(0u, engine_->upload_sessions());
}

TEST_F(Ftl0EngineTest, SessionTableLimit) {
    cfg_.max_sessions = 1;
    make_engine();
    start_upload(500);
    Ftl0Packet cmd;
    cmd.type = Ftl0Type::UploadCmd;
    cmd.length = 500;
    send(cmd);
    EXPECT_EQ(ProtocolError::Busy, single_error());
}

TEST_F(Ftl0EngineTest, WritePastLengthKeepsSession) {
    std::vector<uint8_t> blob = make_blob(100);
    uint32_t n = start_upload(64);
    send_data(n, blob, 32, 64);
    EXPECT_EQ(ProtocolError::Malformed, single_error());
    EXPECT_EQ(1u, engine_->upload_sessions());
}

TEST_F(Ftl0EngineTest, PumpReportsHolesAndExpiresUploads) {
    std::vector<uint8_t> blob = make_blob(300);
    uint32_t n = start_upload((uint32_t)blob.size());
    send_data(n, blob, 0, 64);

    engine_->pump(now_ + milliseconds(500));
    EXPECT_TRUE(replies().empty());
    engine_->pump(now_ + cfg_.hole_report_interval);
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::HoleList, r[0].type);
    EXPECT_EQ((std::vector<ByteRange>{ByteRange{64, (uint32_t)blob.size()}}), r[0].holes);
    engine_->pump(now_ + cfg_.hole_report_interval + milliseconds(100));
    EXPECT_TRUE(replies().empty());

    engine_->pump(now_ + cfg_.transfer_timeout + milliseconds(1));
    EXPECT_EQ(0u, engine_->upload_sessions());
    EXPECT_EQ(0u, store_->stats().pending_transfers);
    send_data(n, blob, 64, 64);
    EXPECT_EQ(ProtocolError::NoSuchSession, single_error());
}

TEST_F(Ftl0EngineTest, DownloadRunsToAck) {
    uint32_t n = stored_file(150);
    request(n);
    EXPECT_TRUE(sink_.frames.empty());
    DownloadState st;
    ASSERT_TRUE(engine_->download_state("K1ABC-1", n, st));
    EXPECT_EQ(DownloadState::SendingDirectory, st);

    engine_->pump(now_);
    ASSERT_EQ(5u, sink_.frames.size());
    DirectoryEntry d;
    ASSERT_EQ(kPidDirectory, sink_.frames[0].pid);
    ASSERT_TRUE(decode_directory_entry(sink_.frames[0].info.data(), sink_.frames[0].info.size(), d));
    std::vector<uint8_t> header;
    ASSERT_EQ(StoreError::Ok, store_->header_bytes(n, header));
    EXPECT_EQ(header, d.header);
    EXPECT_TRUE(d.flags & BF_LAST);

    std::vector<uint8_t> body;
    for (size_t i = 1; i <= 3; i++) {
        const Ax25Frame& f = sink_.frames[i];
        ASSERT_EQ(kPidFileChunk, f.pid);
        FileChunk c;
        ASSERT_TRUE(decode_file_chunk(f.info.data(), f.info.size(), c));
        EXPECT_EQ(body.size(), c.offset);
        EXPECT_EQ(i == 3, (c.flags & BF_LAST) != 0);
        body.insert(body.end(), c.data.begin(), c.data.end());
    }
    EXPECT_EQ(pattern(150, 4), body);

    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::DlDone, r[0].type);
    EXPECT_EQ(150u, r[0].length);
    ASSERT_TRUE(engine_->download_state("K1ABC-1", n, st));
    EXPECT_EQ(DownloadState::AwaitingAck, st);

    simple(Ftl0Type::DlAck, n);
    EXPECT_TRUE(replies().empty());
    EXPECT_EQ(0u, engine_->download_sessions());
    FileMetadata meta;
    ASSERT_EQ(StoreError::Ok, store_->metadata(n, meta));
    EXPECT_EQ(1u, meta.download_count);
}

TEST_F(Ftl0EngineTest, RerequestRetransmitsRanges) {
    uint32_t n = stored_file(150);
    request(n);
    engine_->pump(now_);
    sink_.frames.clear();

    request(n, {ByteRange{64, 128}});
    DownloadState st;
    ASSERT_TRUE(engine_->download_state("K1ABC-1", n, st));
    EXPECT_EQ(DownloadState::Retransmit, st);
    engine_->pump(now_);
    ASSERT_EQ(2u, sink_.frames.size());
    FileChunk c;
    ASSERT_TRUE(decode_file_chunk(sink_.frames[0].info.data(), sink_.frames[0].info.size(), c));
    EXPECT_EQ(64u, c.offset);
    EXPECT_EQ(64u, c.data.size());
    std::vector<Ftl0Packet> r = replies();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Ftl0Type::DlDone, r[0].type);
}

TEST_F(Ftl0EngineTest, BroadcastRequestGoesToScheduler) {
    uint32_t n = stored_file(500);
    request(n, {}, kDlBroadcast);
    EXPECT_TRUE(sink_.frames.empty());
    EXPECT_EQ(0u, engine_->download_sessions());
    EXPECT_EQ(1u, scheduler_->queued());
}

TEST_F(Ftl0EngineTest, DownloadErrors) {
    uint32_t n = stored_file(100);
    request(n + 40);
    EXPECT_EQ(ProtocolError::NoSuchFile, single_error());
    request(n, {ByteRange{500, 600}});
    EXPECT_EQ(ProtocolError::Malformed, single_error());
    simple(Ftl0Type::DlAck, n);
    EXPECT_EQ(ProtocolError::NoSuchSession, single_error());

    request(n);
    simple(Ftl0Type::DlAck, n);
    EXPECT_EQ(ProtocolError::UnexpectedMessage, single_error());
    EXPECT_EQ(0u, engine_->download_sessions());
}

TEST_F(Ftl0EngineTest, DownloadTimesOutWithoutAck) {
    uint32_t n = stored_file(100);
    request(n);
    engine_->pump(now_);
    engine_->pump(now_ + cfg_.transfer_timeout + milliseconds(1));
    EXPECT_EQ(0u, engine_->download_sessions());
}

TEST_F(Ftl0EngineTest, StationPacketsFromClientAreRejected) {
    simple(Ftl0Type::UlAckResp, 5);
    EXPECT_EQ(ProtocolError::UnexpectedMessage, single_error());
    simple(Ftl0Type::DataEnd, 5);
    EXPECT_EQ(ProtocolError::NoSuchSession, single_error());
}

TEST_F(Ftl0EngineTest, MalformedPacketGetsError) {
    send_raw({2, (uint8_t)Ftl0Type::UploadCmd, 0x10, 0x00});
    EXPECT_EQ(ProtocolError::Malformed, single_error());
}

TEST_F(Ftl0EngineTest, IgnoresFramesNotForUs) {
    Ftl0Packet cmd;
    cmd.type = Ftl0Type::UploadCmd;
    cmd.length = 100;
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(encode_ftl0(cmd, bytes));

    Ax25Address other;
    ASSERT_TRUE(parse_address("W2XYZ", other));
    engine_->handle_frame(Ax25Frame::ui(other, remote_, kPidFtl0, bytes), now_);
    send_raw(bytes, kPidFileChunk);
    Ax25Frame connected = Ax25Frame::ui(station_, remote_, kPidFtl0, bytes);
    connected.control = 0x00;
    engine_->handle_frame(connected, now_);

    EXPECT_TRUE(sink_.frames.empty());
    EXPECT_EQ(0u, engine_->upload_sessions());
}
