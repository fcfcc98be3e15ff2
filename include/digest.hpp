#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pacsat {

// BLAKE2b-256 hashing for the store's object layout and integrity index.
class ContentHasher {
public:
    ContentHasher();
    bool ready() const { return ready_; }
    std::string digest_hex(const uint8_t* data, size_t len) const;
    bool digest_file(const std::string& path, std::string& hex) const;
    // Two-level fan-out directory for a file number, e.g. "3f/a0"
    std::string fanout_path(uint32_t file_number) const;
private:
    bool ready_{false};
};

} // namespace pacsat
