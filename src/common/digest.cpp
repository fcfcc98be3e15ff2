#include "digest.hpp"
#include "util.hpp"
#include <fstream>
#include <sodium.h>

namespace pacsat {

static constexpr size_t kDigestBytes = crypto_generichash_BYTES;

ContentHasher::ContentHasher() { ready_ = sodium_init() >= 0; }

std::string ContentHasher::digest_hex(const uint8_t *data, size_t len) const {
  uint8_t out[kDigestBytes];
  crypto_generichash(out, sizeof(out), data, len, nullptr, 0);
  return bytes_to_hex(out, sizeof(out));
}

bool ContentHasher::digest_file(const std::string &path,
                                std::string &hex) const {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;
  crypto_generichash_state st;
  crypto_generichash_init(&st, nullptr, 0, kDigestBytes);
  std::vector<char> buf(64 * 1024);
  while (in) {
    in.read(buf.data(), (std::streamsize)buf.size());
    std::streamsize n = in.gcount();
    if (n > 0)
      crypto_generichash_update(&st, (const uint8_t *)buf.data(), (size_t)n);
  }
  if (in.bad())
    return false;
  uint8_t out[kDigestBytes];
  crypto_generichash_final(&st, out, sizeof(out));
  hex = bytes_to_hex(out, sizeof(out));
  return true;
}

std::string ContentHasher::fanout_path(uint32_t file_number) const {
  uint8_t key[4] = {(uint8_t)file_number, (uint8_t)(file_number >> 8),
                    (uint8_t)(file_number >> 16), (uint8_t)(file_number >> 24)};
  uint8_t out[kDigestBytes];
  crypto_generichash(out, sizeof(out), key, sizeof(key), nullptr, 0);
  return bytes_to_hex(out, 1) + "/" + bytes_to_hex(out + 1, 1);
}

} // namespace pacsat
