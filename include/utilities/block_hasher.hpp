#ifndef CHUNKSEAL_BLOCK_HASHER_HPP
#define CHUNKSEAL_BLOCK_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "utilities/digest.hpp"

namespace chunkseal {

/// Result of hashing one block of data.
struct DigestResult {
  Digest digest{};     ///< SHA-256 of the ingested bytes
  std::string hex;     ///< Lowercase hex of @ref digest
  uint32_t crc32c = 0; ///< CRC32C of the ingested bytes
  uint64_t size = 0;   ///< Number of bytes ingested
};

/**
 * @brief Streaming SHA-256 + CRC32C over a block of data.
 *
 * Bytes are hashed as they arrive and never buffered, so a block may be
 * arbitrarily large. One instance hashes exactly one block; call reset()
 * to reuse it.
 */
class BlockHasher {
public:
  BlockHasher();

  // Feeds data into both the SHA-256 state and the running CRC32C.
  void ingest(const uint8_t *data, size_t size);

  /** Number of bytes ingested since construction or the last reset(). */
  uint64_t size() const { return size_; }

  /**
   * @brief Finalize both checksums.
   * @throw std::logic_error If called twice without reset().
   */
  DigestResult finalize_hashed();

  /** Start a new block. */
  void reset();

private:
  crypto_hash_sha256_state sha_state_; // Libsodium SHA-256 state
  uint32_t crc_;
  uint64_t size_ = 0;
  bool finalized_ = false;
};

} // namespace chunkseal

#endif // CHUNKSEAL_BLOCK_HASHER_HPP
