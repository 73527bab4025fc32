#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace docvec::core {

// Sha256 is an incremental FIPS 180-4 SHA-256 hasher.
// Feed any number of byte ranges through update(), then call hex_digest() once.
// Document identifiers are built from several framed pieces, so the streaming form
// avoids concatenating large contents just to hash them.
class Sha256 {
 public:
  Sha256();

  Sha256& update(std::string_view bytes);

  // Finalizes the digest and returns it as 64 lower-case hex characters.
  // The hasher must not be updated afterwards.
  [[nodiscard]] std::string hex_digest();

 private:
  void process_block(const std::uint8_t* block);

  std::array<std::uint32_t, 8> state_;
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
};

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace docvec::core
