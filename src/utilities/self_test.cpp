#include "utilities/self_test.h"
#include "upload/streaming_merkle_tree.hpp"
#include "utilities/crc32c.hpp"
#include "utilities/digest.hpp"
#include "utilities/logger.h"

#include <sodium.h>

using chunkseal::Digest;

bool integrity_self_test() {
  if (sodium_init() < 0) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Self test: libsodium failed to initialize");
    return false;
  }
  bool ok = true;

  const char msg[] = "abc";
  const Digest abc = chunkseal::sha256(
      reinterpret_cast<const uint8_t *>(msg), sizeof(msg) - 1);
  const Digest abcExpected = {
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40,
      0xde, 0x5d, 0xae, 0x22, 0x23, 0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17,
      0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
  if (!chunkseal::digestEquals(abc, abcExpected)) {
    Logger::getInstance().log(LogLevel::ERROR, "Self test: SHA-256 mismatch");
    ok = false;
  }

  const char check[] = "123456789";
  if (chunkseal::crc32c(reinterpret_cast<const uint8_t *>(check),
                        sizeof(check) - 1) != 0xE3069283u) {
    Logger::getInstance().log(LogLevel::ERROR, "Self test: CRC32C mismatch");
    ok = false;
  }

  const Digest emptyExpected = {
      0x6e, 0x34, 0x0b, 0x9c, 0xff, 0xb3, 0x7a, 0x98, 0x9c, 0xa5, 0x44,
      0xe6, 0xbb, 0x78, 0x0a, 0x2c, 0x78, 0x90, 0x1d, 0x3f, 0xb3, 0x37,
      0x38, 0x76, 0x85, 0x11, 0xa3, 0x06, 0x17, 0xaf, 0xa0, 0x1d};
  if (!chunkseal::digestEquals(chunkseal::StreamingMerkleTree::emptyRoot(),
                               emptyExpected)) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Self test: empty Merkle root mismatch");
    ok = false;
  }
  return ok;
}
