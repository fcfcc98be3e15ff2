#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "digest.hpp"
#include "hole_list.hpp"
#include "pfh.hpp"

namespace pacsat {

enum class StoreError : uint8_t {
    Ok = 0,
    NotFound,
    Forbidden,
    Overlap,
    Conflict,
    Rejected,
    Invalid,
    Io,
    Exhausted   // disk full or out of descriptors; needs an operator
};

const char* to_string(StoreError e);

enum class FileState : uint8_t { Pending, Complete, Active, Trashed, Purged, Rejected };

struct FileMetadata {
    uint32_t file_number{0};
    std::string filename;
    std::string source;
    std::string destination;
    std::string description;
    uint32_t size{0};
    uint32_t upload_time{0};
    uint8_t priority{0};
    uint32_t download_count{0};
    FileState state{FileState::Active};
    std::string relpath;
    std::string digest;
};

struct TrashEntry {
    std::string trash_name;
    FileMetadata meta;
    std::filesystem::file_time_type trashed_at;
};

using TransferHandle = uint64_t;

// Identity of whoever asks for a destructive operation. `privileged` is the
// caller's authorization decision; the store only compares callsigns.
struct Actor {
    std::string callsign;
    bool privileged{false};
};

struct ListFilter {
    std::string source;
    std::string name;
    uint8_t min_priority{0};
};

enum class SortKey : uint8_t { Number, UploadTime, Size, Name };

struct ListSort {
    SortKey key{SortKey::UploadTime};
    bool descending{true};
};

struct Page {
    size_t index{0};
    size_t size{50};
};

struct ChunkOutcome {
    FileState state{FileState::Pending};
    uint32_t file_number{0};
    uint32_t new_bytes{0};
    HeaderError header_error{HeaderError::Ok};
};

struct StoreStats {
    size_t active_files{0};
    uint64_t active_bytes{0};
    size_t trashed_files{0};
    size_t pending_transfers{0};
};

// Content-hierarchy file store. Each file is one blob (serialized PFH
// followed by the body) under objects/<aa>/<bb>/<number>.pfh. Blobs are
// written to a temporary name and renamed into place, so readers see a file
// either whole or not at all.
class FileStore {
public:
    explicit FileStore(std::string root);
    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    StoreError open();
    const std::string& root() const { return root_; }

    StoreError allocate_file_number(uint32_t& out);

    // uploads
    StoreError begin_receive(const Pfh& stub, uint32_t expected_size, TransferHandle& out);
    StoreError write_chunk(TransferHandle h, uint32_t offset, const uint8_t* data, size_t len,
                           ChunkOutcome* outcome = nullptr);
    StoreError holes(TransferHandle h, HoleList& out) const;
    // Contiguous bytes from offset 0, at most max_len of them
    StoreError pending_prefix(TransferHandle h, std::vector<uint8_t>& out,
                              size_t max_len = SIZE_MAX) const;
    StoreError abandon(TransferHandle h);

    StoreError store_file(const Pfh& pfh, const std::vector<uint8_t>& body, uint32_t& number);

    // retrieval; trashed files are invisible here
    StoreError download(uint32_t number, uint32_t offset, uint32_t length, Pfh& pfh,
                        std::vector<uint8_t>& body) const;
    StoreError download_raw(uint32_t number, std::vector<uint8_t>& blob) const;
    StoreError header_bytes(uint32_t number, std::vector<uint8_t>& out) const;
    StoreError metadata(uint32_t number, FileMetadata& out) const;
    StoreError record_download(uint32_t number);
    StoreError verify(uint32_t number) const;

    // deletion lifecycle
    StoreError soft_delete(uint32_t number, const Actor& actor, std::string* trash_name = nullptr);
    StoreError recover(const std::string& trash_name, uint32_t& number);
    StoreError purge(uint32_t number);
    StoreError purge_trash(const std::string& trash_name);
    size_t purge_expired_trash(std::chrono::seconds retention);
    std::vector<TrashEntry> list_trash() const;

    std::vector<FileMetadata> list(const ListFilter& filter, const ListSort& sort,
                                   const Page& page) const;
    std::vector<FileMetadata> search(const std::string& query) const;
    std::vector<uint32_t> active_numbers() const;
    bool is_active(uint32_t number) const;
    StoreStats stats() const;

    std::string object_path(uint32_t number) const;

private:
    struct Pending {
        Pfh stub;
        uint32_t size{0};
        HoleList holes;
        std::string path;
        std::unique_ptr<std::fstream> stream;
    };

    std::string object_relpath(uint32_t number) const;
    std::string trash_relpath_for(uint32_t number) const;
    StoreError finish_receive(TransferHandle h, Pending& p, ChunkOutcome& outcome);
    StoreError commit_blob(uint32_t number, const std::vector<uint8_t>& blob, FileMetadata& meta);
    StoreError read_header(const std::string& path, PfhView& view, std::vector<uint8_t>& buf,
                           uint64_t& file_size) const;
    StoreError persist_counter();
    StoreError write_index();
    void load_index_digests(std::map<uint32_t, std::string>& out) const;
    void scan_objects(const std::map<uint32_t, std::string>& known, uint32_t& highest);
    void scan_trash(uint32_t& highest);
    void prune_dirs(std::filesystem::path dir, const std::filesystem::path& stop);

    std::string root_;
    ContentHasher hasher_;
    mutable std::mutex mtx_;
    uint32_t next_number_{1};
    TransferHandle next_handle_{1};
    std::map<uint32_t, FileMetadata> active_;
    std::map<std::string, TrashEntry> trash_;
    std::map<TransferHandle, Pending> pending_;
};

} // namespace pacsat
