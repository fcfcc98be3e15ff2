#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include "file_store.hpp"
#include "test_support.hpp"

using namespace pacsat;
using namespace pacsat::testing_support;
namespace fs = std::filesystem;

class FileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.reset(new FileStore(dir_.str()));
        ASSERT_EQ(StoreError::Ok, store_->open());
    }

    void reopen() {
        store_.reset(new FileStore(dir_.str()));
        ASSERT_EQ(StoreError::Ok, store_->open());
    }

    uint32_t put(const std::string& name, const std::string& source, size_t size,
                 uint32_t upload_time = 1700000000, const std::string& description = "") {
        std::vector<uint8_t> body = pattern(size, (uint8_t)name.size());
        Pfh h = sample_header(name, source, body);
        h.upload_time = upload_time;
        if (!description.empty())
            h.optional.emplace_back(DescriptionItem{description});
        uint32_t n = 0;
        EXPECT_EQ(StoreError::Ok, store_->store_file(h, body, n));
        return n;
    }

    // Starts an upload of header+body sized exactly `total` bytes.
    TransferHandle begin_upload(size_t total, std::vector<uint8_t>& blob, uint32_t& number) {
        Pfh sizing = sample_header("UPLOAD", "K1ABC", {});
        size_t header_len = serialize_pfh(sizing).size();
        std::vector<uint8_t> body = pattern(total - header_len, 3);
        Pfh h = sample_header("UPLOAD", "K1ABC", body);
        blob = upload_blob(h, body);
        EXPECT_EQ(total, blob.size());
        EXPECT_EQ(StoreError::Ok, store_->allocate_file_number(number));
        Pfh stub;
        stub.file_number = number;
        stub.source = "K1ABC";
        stub.upload_time = 1700001234;
        TransferHandle handle = 0;
        EXPECT_EQ(StoreError::Ok, store_->begin_receive(stub, (uint32_t)total, handle));
        return handle;
    }

    static std::vector<uint8_t> read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), {});
    }

    ScratchDir dir_;
    std::unique_ptr<FileStore> store_;
};

TEST_F(FileStoreTest, NumbersIncreaseAndSurviveRestart) {
    uint32_t a = 0, b = 0, c = 0;
    ASSERT_EQ(StoreError::Ok, store_->allocate_file_number(a));
    ASSERT_EQ(StoreError::Ok, store_->allocate_file_number(b));
    EXPECT_GE(a, 1u);
    EXPECT_EQ(a + 1, b);
    reopen();
    ASSERT_EQ(StoreError::Ok, store_->allocate_file_number(c));
    EXPECT_GT(c, b);
}

TEST_F(FileStoreTest, PurgedNumbersAreNeverReused) {
    uint32_t n = put("GONE", "K1ABC", 10);
    ASSERT_EQ(StoreError::Ok, store_->purge(n));
    EXPECT_FALSE(store_->is_active(n));
    EXPECT_EQ(StoreError::NotFound, store_->purge(n));
    reopen();
    uint32_t m = put("NEXT", "K1ABC", 10);
    EXPECT_GT(m, n);
}

TEST_F(FileStoreTest, BlobLivesAtHashedPath) {
    uint32_t n = put("PATHS", "K1ABC", 40);
    std::string path = store_->object_path(n);
    EXPECT_TRUE(fs::exists(path));
    fs::path rel = fs::relative(path, dir_.path() / "objects");
    std::vector<std::string> parts;
    for (const auto& p : rel)
        parts.push_back(p.string());
    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ(2u, parts[0].size());
    EXPECT_EQ(2u, parts[1].size());
    char name[16];
    std::snprintf(name, sizeof(name), "%08x.pfh", n);
    EXPECT_EQ(name, parts[2]);
}

TEST_F(FileStoreTest, OutOfOrderChunksCompleteOnLastHole) {
    std::vector<uint8_t> blob;
    uint32_t number = 0;
    TransferHandle h = begin_upload(1024, blob, number);

    for (int chunk : {2, 0, 3}) {
        ChunkOutcome oc;
        ASSERT_EQ(StoreError::Ok,
                  store_->write_chunk(h, chunk * 256, blob.data() + chunk * 256, 256, &oc));
        EXPECT_EQ(FileState::Pending, oc.state);
        EXPECT_EQ(256u, oc.new_bytes);
    }
    HoleList holes;
    ASSERT_EQ(StoreError::Ok, store_->holes(h, holes));
    ASSERT_EQ(1u, holes.ranges().size());
    EXPECT_EQ((ByteRange{256, 512}), holes.ranges()[0]);
    EXPECT_FALSE(store_->is_active(number));

    ChunkOutcome oc;
    ASSERT_EQ(StoreError::Ok, store_->write_chunk(h, 256, blob.data() + 256, 256, &oc));
    EXPECT_EQ(FileState::Active, oc.state);
    EXPECT_EQ(number, oc.file_number);
    EXPECT_EQ(StoreError::NotFound, store_->holes(h, holes));
    EXPECT_TRUE(store_->is_active(number));

    FileMetadata meta;
    ASSERT_EQ(StoreError::Ok, store_->metadata(number, meta));
    EXPECT_EQ("UPLOAD.TXT", meta.filename);
    EXPECT_EQ(1700001234u, meta.upload_time);

    Pfh pfh;
    std::vector<uint8_t> body;
    ASSERT_EQ(StoreError::Ok, store_->download(number, 0, 0xFFFFFFFF, pfh, body));
    EXPECT_EQ(number, pfh.file_number);
    PfhView view;
    ASSERT_EQ(HeaderError::Ok, parse_pfh(blob.data(), blob.size(), view));
    EXPECT_EQ(std::vector<uint8_t>(view.body, view.body + view.body_len), body);
}

TEST_F(FileStoreTest, DuplicateAndOverlappingChunksAreIdempotent) {
    std::vector<uint8_t> blob;
    uint32_t number = 0;
    TransferHandle h = begin_upload(600, blob, number);

    ChunkOutcome oc;
    ASSERT_EQ(StoreError::Ok, store_->write_chunk(h, 0, blob.data(), 300, &oc));
    ASSERT_EQ(StoreError::Ok, store_->write_chunk(h, 0, blob.data(), 300, &oc));
    EXPECT_EQ(0u, oc.new_bytes);
    // a duplicate with different bytes must not change filled territory
    std::vector<uint8_t> junk(300, 0xEE);
    ASSERT_EQ(StoreError::Ok, store_->write_chunk(h, 0, junk.data(), 300, &oc));
    EXPECT_EQ(0u, oc.new_bytes);

    ASSERT_EQ(StoreError::Ok, store_->write_chunk(h, 250, blob.data() + 250, 200, &oc));
    EXPECT_EQ(150u, oc.new_bytes);
    std::vector<uint8_t> prefix;
    ASSERT_EQ(StoreError::Ok, store_->pending_prefix(h, prefix));
    EXPECT_EQ(std::vector<uint8_t>(blob.begin(), blob.begin() + 450), prefix);
    ASSERT_EQ(StoreError::Ok, store_->pending_prefix(h, prefix, 100));
    EXPECT_EQ(std::vector<uint8_t>(blob.begin(), blob.begin() + 100), prefix);

    ASSERT_EQ(StoreError::Ok, store_->write_chunk(h, 400, blob.data() + 400, 200, &oc));
    EXPECT_EQ(FileState::Active, oc.state);

    std::vector<uint8_t> raw;
    ASSERT_EQ(StoreError::Ok, store_->download_raw(number, raw));
    PfhView stored, sent;
    ASSERT_EQ(HeaderError::Ok, parse_pfh(raw.data(), raw.size(), stored));
    ASSERT_EQ(HeaderError::Ok, parse_pfh(blob.data(), blob.size(), sent));
    EXPECT_EQ(std::vector<uint8_t>(sent.body, sent.body + sent.body_len),
              std::vector<uint8_t>(stored.body, stored.body + stored.body_len));
}

TEST_F(FileStoreTest, WritePastDeclaredSizeIsOverlap) {
    std::vector<uint8_t> blob;
    uint32_t number = 0;
    TransferHandle h = begin_upload(400, blob, number);
    std::vector<uint8_t> data(50, 1);
    EXPECT_EQ(StoreError::Overlap, store_->write_chunk(h, 380, data.data(), data.size()));
    HoleList holes;
    ASSERT_EQ(StoreError::Ok, store_->holes(h, holes));
    EXPECT_EQ(400u, holes.missing_bytes());
    EXPECT_EQ(StoreError::NotFound, store_->write_chunk(h + 100, 0, data.data(), 10));
}

TEST_F(FileStoreTest, BodyChecksumMismatchIsRejected) {
    std::vector<uint8_t> blob;
    uint32_t number = 0;
    TransferHandle h = begin_upload(500, blob, number);
    blob[450] ^= 0x5A;
    ChunkOutcome oc;
    EXPECT_EQ(StoreError::Rejected, store_->write_chunk(h, 0, blob.data(), blob.size(), &oc));
    EXPECT_EQ(FileState::Rejected, oc.state);
    EXPECT_EQ(HeaderError::Ok, oc.header_error);
    EXPECT_FALSE(store_->is_active(number));
    EXPECT_EQ(0u, store_->stats().pending_transfers);
    EXPECT_TRUE(fs::is_empty(dir_.path() / "pending"));
}

TEST_F(FileStoreTest, BadHeaderIsRejected) {
    std::vector<uint8_t> blob;
    uint32_t number = 0;
    TransferHandle h = begin_upload(500, blob, number);
    blob[5] ^= 0x01;
    ChunkOutcome oc;
    EXPECT_EQ(StoreError::Rejected, store_->write_chunk(h, 0, blob.data(), blob.size(), &oc));
    EXPECT_EQ(HeaderError::BadChecksum, oc.header_error);
}

TEST_F(FileStoreTest, AbandonReleasesPartialUpload) {
    std::vector<uint8_t> blob;
    uint32_t number = 0;
    TransferHandle h = begin_upload(500, blob, number);
    ASSERT_EQ(StoreError::Ok, store_->write_chunk(h, 0, blob.data(), 100));
    EXPECT_EQ(1u, store_->stats().pending_transfers);
    ASSERT_EQ(StoreError::Ok, store_->abandon(h));
    EXPECT_EQ(0u, store_->stats().pending_transfers);
    EXPECT_TRUE(fs::is_empty(dir_.path() / "pending"));
    EXPECT_EQ(StoreError::NotFound, store_->abandon(h));
}

TEST_F(FileStoreTest, DownloadSlices) {
    uint32_t n = put("SLICE", "K1ABC", 100);
    Pfh pfh;
    std::vector<uint8_t> body;
    ASSERT_EQ(StoreError::Ok, store_->download(n, 90, 50, pfh, body));
    EXPECT_EQ(10u, body.size());
    EXPECT_EQ(pattern(100, 5)[90], body[0]);
    EXPECT_EQ(100u, pfh.file_size);
    EXPECT_EQ(StoreError::Invalid, store_->download(n, 101, 1, pfh, body));
    EXPECT_EQ(StoreError::NotFound, store_->download(n + 1, 0, 1, pfh, body));

    std::vector<uint8_t> header;
    ASSERT_EQ(StoreError::Ok, store_->header_bytes(n, header));
    EXPECT_EQ(serialize_pfh(pfh), header);
}

TEST_F(FileStoreTest, SoftDeleteChecksOwnership) {
    uint32_t n = put("OWNED", "K1ABC", 20);
    EXPECT_EQ(StoreError::Forbidden, store_->soft_delete(n, Actor{"W2XYZ", false}));
    EXPECT_TRUE(store_->is_active(n));
    std::string trash;
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(n, Actor{"k1abc", false}, &trash));
    EXPECT_FALSE(store_->is_active(n));
    EXPECT_EQ(StoreError::NotFound, store_->soft_delete(n, Actor{"K1ABC", true}));

    uint32_t m = put("OTHER", "K1ABC", 20);
    EXPECT_EQ(StoreError::Ok, store_->soft_delete(m, Actor{"SYSOP", true}));
    EXPECT_EQ(2u, store_->list_trash().size());
}

TEST_F(FileStoreTest, TrashedFileIsInvisibleToRetrieval) {
    uint32_t n = put("HIDDEN", "K1ABC", 20);
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(n, Actor{"K1ABC", false}));
    std::vector<uint8_t> raw;
    EXPECT_EQ(StoreError::NotFound, store_->download_raw(n, raw));
    FileMetadata meta;
    EXPECT_EQ(StoreError::NotFound, store_->metadata(n, meta));
    EXPECT_TRUE(store_->list(ListFilter{}, ListSort{}, Page{}).empty());
    EXPECT_TRUE(store_->active_numbers().empty());
}

TEST_F(FileStoreTest, RecoverRestoresIdenticalBytes) {
    uint32_t n = put("KEEP", "K1ABC", 77);
    std::vector<uint8_t> before;
    ASSERT_EQ(StoreError::Ok, store_->download_raw(n, before));
    std::string trash;
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(n, Actor{"K1ABC", false}, &trash));
    EXPECT_TRUE(fs::exists(dir_.path() / "trash" / trash));
    EXPECT_FALSE(fs::exists(store_->object_path(n)));

    uint32_t recovered = 0;
    ASSERT_EQ(StoreError::Ok, store_->recover(trash, recovered));
    EXPECT_EQ(n, recovered);
    std::vector<uint8_t> after;
    ASSERT_EQ(StoreError::Ok, store_->download_raw(n, after));
    EXPECT_EQ(before, after);
    EXPECT_EQ(StoreError::Ok, store_->verify(n));
    EXPECT_TRUE(store_->list_trash().empty());
    EXPECT_EQ(StoreError::NotFound, store_->recover(trash, recovered));
}

TEST_F(FileStoreTest, RecoverConflictsWithActiveNumber) {
    uint32_t n = put("TWICE", "K1ABC", 30);
    std::vector<uint8_t> raw;
    ASSERT_EQ(StoreError::Ok, store_->download_raw(n, raw));
    std::string trash;
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(n, Actor{"K1ABC", false}, &trash));
    // an operator copies the blob back by hand
    fs::create_directories(fs::path(store_->object_path(n)).parent_path());
    fs::copy_file(dir_.path() / "trash" / trash, store_->object_path(n));
    reopen();
    EXPECT_TRUE(store_->is_active(n));
    uint32_t recovered = 0;
    EXPECT_EQ(StoreError::Conflict, store_->recover(trash, recovered));
    EXPECT_EQ(1u, store_->list_trash().size());
}

TEST_F(FileStoreTest, TrashNamesAvoidCollisions) {
    uint32_t n = put("CLASH", "K1ABC", 30);
    std::string first;
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(n, Actor{"K1ABC", false}, &first));
    uint32_t back = 0;
    ASSERT_EQ(StoreError::Ok, store_->recover(first, back));
    // leave a stray file where the first trash copy used to be
    fs::create_directories((dir_.path() / "trash" / first).parent_path());
    std::ofstream(dir_.path() / "trash" / first) << "stray";
    std::string second;
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(n, Actor{"K1ABC", false}, &second));
    EXPECT_NE(first, second);
    EXPECT_NE(std::string::npos, second.find("~1.pfh"));
}

TEST_F(FileStoreTest, PurgeExpiredTrash) {
    uint32_t a = put("OLD", "K1ABC", 10);
    uint32_t b = put("NEW", "K1ABC", 10);
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(a, Actor{"K1ABC", false}));
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(b, Actor{"K1ABC", false}));
    EXPECT_EQ(0u, store_->purge_expired_trash(std::chrono::hours(1)));
    EXPECT_EQ(2u, store_->purge_expired_trash(std::chrono::seconds(0)));
    EXPECT_TRUE(store_->list_trash().empty());
    EXPECT_EQ(StoreError::NotFound, store_->purge(a));
}

TEST_F(FileStoreTest, ListFiltersSortsAndPages) {
    uint32_t a = put("ALPHA", "K1ABC", 30, 100);
    uint32_t b = put("BRAVO", "W2XYZ", 10, 300);
    uint32_t c = put("CHARLIE", "K1ABC", 20, 200);

    std::vector<FileMetadata> rows = store_->list(ListFilter{}, ListSort{}, Page{});
    ASSERT_EQ(3u, rows.size());
    EXPECT_EQ(b, rows[0].file_number);
    EXPECT_EQ(c, rows[1].file_number);
    EXPECT_EQ(a, rows[2].file_number);

    ListFilter by_source;
    by_source.source = "k1abc";
    rows = store_->list(by_source, ListSort{SortKey::Size, false}, Page{});
    ASSERT_EQ(2u, rows.size());
    EXPECT_EQ(c, rows[0].file_number);
    EXPECT_EQ(a, rows[1].file_number);

    ListFilter by_name;
    by_name.name = "rav";
    rows = store_->list(by_name, ListSort{}, Page{});
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ(b, rows[0].file_number);

    rows = store_->list(ListFilter{}, ListSort{SortKey::Name, false}, Page{1, 2});
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ(c, rows[0].file_number);
    EXPECT_TRUE(store_->list(ListFilter{}, ListSort{}, Page{5, 2}).empty());

    EXPECT_EQ((std::vector<uint32_t>{b, c, a}), store_->active_numbers());
}

TEST_F(FileStoreTest, SearchMatchesDescriptionAndCallsigns) {
    uint32_t a = put("LOG", "K1ABC", 10, 100, "Field Day contact log");
    uint32_t b = put("MAP", "W2XYZ", 10, 200, "grid map");
    EXPECT_EQ(std::vector<uint32_t>{a}, [&] {
        std::vector<uint32_t> v;
        for (const auto& m : store_->search("FIELD DAY"))
            v.push_back(m.file_number);
        return v;
    }());
    std::vector<FileMetadata> rows = store_->search("x");
    ASSERT_EQ(2u, rows.size());   // W2XYZ and .TXT
    EXPECT_EQ(b, rows[0].file_number);
    EXPECT_TRUE(store_->search("nothing here").empty());
}

TEST_F(FileStoreTest, RecordDownloadBumpsCounter) {
    uint32_t n = put("POPULAR", "K1ABC", 10);
    ASSERT_EQ(StoreError::Ok, store_->record_download(n));
    ASSERT_EQ(StoreError::Ok, store_->record_download(n));
    FileMetadata meta;
    ASSERT_EQ(StoreError::Ok, store_->metadata(n, meta));
    EXPECT_EQ(2u, meta.download_count);
    EXPECT_EQ(StoreError::Ok, store_->verify(n));
}

TEST_F(FileStoreTest, VerifyDetectsTampering) {
    uint32_t n = put("TAMPER", "K1ABC", 64);
    ASSERT_EQ(StoreError::Ok, store_->verify(n));
    std::vector<uint8_t> bytes = read_file(store_->object_path(n));
    bytes.back() ^= 0xFF;
    std::ofstream(store_->object_path(n), std::ios::binary | std::ios::trunc)
        .write((const char*)bytes.data(), (std::streamsize)bytes.size());
    EXPECT_EQ(StoreError::Rejected, store_->verify(n));
}

TEST_F(FileStoreTest, ReopenRebuildsIndex) {
    uint32_t a = put("ONE", "K1ABC", 10, 100);
    uint32_t b = put("TWO", "K1ABC", 10, 200);
    ASSERT_EQ(StoreError::Ok, store_->soft_delete(a, Actor{"K1ABC", false}));
    // a corrupt blob is left out of the index
    std::vector<uint8_t> junk(40, 0x11);
    fs::path bogus = fs::path(store_->object_path(b)).parent_path() / "ffffffff.pfh";
    std::ofstream(bogus, std::ios::binary).write((const char*)junk.data(), junk.size());
    reopen();
    EXPECT_EQ(std::vector<uint32_t>{b}, store_->active_numbers());
    EXPECT_EQ(1u, store_->list_trash().size());
    StoreStats s = store_->stats();
    EXPECT_EQ(1u, s.active_files);
    EXPECT_EQ(10u, s.active_bytes);
    EXPECT_EQ(1u, s.trashed_files);

    std::ifstream index(dir_.path() / "index.tsv");
    std::string line;
    int rows = 0;
    while (std::getline(index, line)) {
        rows++;
        EXPECT_EQ(7, std::count(line.begin(), line.end(), '\t'));
    }
    EXPECT_EQ(2, rows);
}
