#include "gtest/gtest.h"
#include "utilities/crc32c.hpp"

#include <string>
#include <vector>

using namespace chunkseal;

namespace {
uint32_t crcOf(const std::string &s) {
  return crc32c(reinterpret_cast<const uint8_t *>(s.data()), s.size());
}
} // namespace

TEST(Crc32cTest, CheckValue) { EXPECT_EQ(crcOf("123456789"), 0xE3069283u); }

TEST(Crc32cTest, EmptyInput) { EXPECT_EQ(crcOf(""), 0u); }

TEST(Crc32cTest, KnownVectors) {
  // 32 bytes of zeros and of 0xFF, from RFC 3720 appendix B.4.
  std::vector<uint8_t> zeros(32, 0x00);
  std::vector<uint8_t> ones(32, 0xFF);
  EXPECT_EQ(crc32c(zeros.data(), zeros.size()), 0x8A9136AAu);
  EXPECT_EQ(crc32c(ones.data(), ones.size()), 0x62A8AB43u);
}

TEST(Crc32cTest, IncrementalMatchesOneShot) {
  const std::string text = "The quick brown fox jumps over the lazy dog";
  const auto *p = reinterpret_cast<const uint8_t *>(text.data());
  for (size_t split = 0; split <= text.size(); split += 7) {
    uint32_t state = CRC32C_INIT;
    state = crc32c_update(state, p, split);
    state = crc32c_update(state, p + split, text.size() - split);
    EXPECT_EQ(crc32c_finalize(state), crcOf(text)) << "split " << split;
  }
}
