#ifndef CHUNKSEAL_DIGEST_HPP
#define CHUNKSEAL_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <string>
#include <string_view>
#include <vector>

namespace chunkseal {

/// Digest size for SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

/// Length of the lowercase hex encoding of a digest.
inline constexpr size_t DIGEST_HEX_SIZE = DIGEST_SIZE * 2;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Encode a digest as 64 lowercase hex characters.
 */
std::string toHex(const Digest &digest);

/**
 * @brief Decode a 64 character hex string into a digest.
 *
 * Upper and lower case are both accepted.
 * @throws ContractViolation if the string is empty, has the wrong length or
 *         contains a non-hex character.
 */
Digest digestFromHex(const std::string &hex);

/**
 * @brief Check the shape of a hex digest without decoding it.
 */
bool isDigestHex(const std::string &hex);

/** One-shot SHA-256 of a buffer. */
Digest sha256(const uint8_t *data, size_t size);
Digest sha256(const std::vector<uint8_t> &data);
Digest sha256(const std::string &data);

/**
 * @brief Constant-time digest comparison.
 */
bool digestEquals(const Digest &a, const Digest &b);

/**
 * @brief Incremental SHA-256 over several buffers.
 *
 * Thin RAII wrapper over libsodium's streaming state so that hashing code
 * can feed domain tags, indices and payloads without concatenating them.
 */
class Sha256Builder {
public:
  Sha256Builder();

  Sha256Builder &update(const uint8_t *data, size_t size);
  Sha256Builder &update(const Digest &digest);
  Sha256Builder &update(std::string_view data);
  Sha256Builder &updateByte(uint8_t value);

  /**
   * @brief Produce the digest.
   * @throw std::logic_error If called more than once.
   */
  Digest finalize();

private:
  crypto_hash_sha256_state state_; // Libsodium SHA-256 state
  bool finalized_ = false;
};

} // namespace chunkseal

#endif // CHUNKSEAL_DIGEST_HPP
