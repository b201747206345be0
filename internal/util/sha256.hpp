#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace stageflow::util {

/*
  Streaming SHA-256 (FIPS 180-4).

  Used for cache key derivation. No internal synchronization.
*/
class Sha256 {
 public:
  static constexpr std::size_t kDigestSize = 32;
  using Digest                             = std::array<uint8_t, kDigestSize>;

  Sha256();

  void Update(const void* data, std::size_t size);
  void Update(std::string_view data);

  Digest Final();

 private:
  void Transform(const uint8_t* block);

  std::array<uint32_t, 8> state_;
  std::array<uint8_t, 64> buffer_{};
  std::size_t             buffered_{0};
  uint64_t                total_bytes_{0};
  bool                    finalized_{false};
};

std::string HexEncode(const uint8_t* data, std::size_t size);
std::string HexEncode(std::string_view data);
std::string HexDecode(std::string_view hex);

std::string Sha256Hex(std::string_view data);

} // namespace stageflow::util
