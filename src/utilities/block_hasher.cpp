#include "utilities/block_hasher.hpp"
#include "utilities/crc32c.hpp"

#include <stdexcept>

namespace chunkseal {

BlockHasher::BlockHasher() {
  if (sodium_init() < 0) {
    // sodium_init() returns -1 on error, 0 on success, 1 if already
    // initialized.
    throw std::runtime_error("Failed to initialize libsodium");
  }
  reset();
}

void BlockHasher::reset() {
  crypto_hash_sha256_init(&sha_state_);
  crc_ = CRC32C_INIT;
  size_ = 0;
  finalized_ = false;
}

void BlockHasher::ingest(const uint8_t *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(&sha_state_, data, size);
    crc_ = crc32c_update(crc_, data, size);
    size_ += size;
  }
}

DigestResult BlockHasher::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }

  DigestResult result;
  crypto_hash_sha256_final(&sha_state_, result.digest.data());
  result.hex = toHex(result.digest);
  result.crc32c = crc32c_finalize(crc_);
  result.size = size_;

  finalized_ = true;
  return result;
}

} // namespace chunkseal
