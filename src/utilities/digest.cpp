#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

#include <cctype>
#include <stdexcept>

namespace chunkseal {

std::string toHex(const Digest &digest) {
  char hex[DIGEST_HEX_SIZE + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex, DIGEST_HEX_SIZE);
}

bool isDigestHex(const std::string &hex) {
  if (hex.size() != DIGEST_HEX_SIZE)
    return false;
  for (char c : hex) {
    if (!std::isxdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

Digest digestFromHex(const std::string &hex) {
  if (hex.empty()) {
    raiseContractViolation("Digest hex string cannot be empty.");
  }
  if (hex.size() != DIGEST_HEX_SIZE) {
    raiseContractViolation("Digest hex string must be " +
                           std::to_string(DIGEST_HEX_SIZE) +
                           " characters, got " + std::to_string(hex.size()));
  }
  if (!isDigestHex(hex)) {
    raiseContractViolation("Digest hex string contains a non-hex character: " +
                           hex);
  }

  Digest digest{};
  size_t decoded = 0;
  if (sodium_hex2bin(digest.data(), digest.size(), hex.data(), hex.size(),
                     nullptr, &decoded, nullptr) != 0 ||
      decoded != DIGEST_SIZE) {
    raiseContractViolation("Failed to decode digest hex: " + hex);
  }
  return digest;
}

Digest sha256(const uint8_t *data, size_t size) {
  Sha256Builder b;
  b.update(data, size);
  return b.finalize();
}

Digest sha256(const std::vector<uint8_t> &data) {
  return sha256(data.data(), data.size());
}

Digest sha256(const std::string &data) {
  return sha256(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

bool digestEquals(const Digest &a, const Digest &b) {
  return sodium_memcmp(a.data(), b.data(), DIGEST_SIZE) == 0;
}

Sha256Builder::Sha256Builder() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&state_);
}

Sha256Builder &Sha256Builder::update(const uint8_t *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot update a finalized SHA-256 builder.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(&state_, data, size);
  }
  return *this;
}

Sha256Builder &Sha256Builder::update(const Digest &digest) {
  return update(digest.data(), digest.size());
}

Sha256Builder &Sha256Builder::update(std::string_view data) {
  return update(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

Sha256Builder &Sha256Builder::updateByte(uint8_t value) {
  return update(&value, 1);
}

Digest Sha256Builder::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  Digest out{};
  crypto_hash_sha256_final(&state_, out.data());
  finalized_ = true;
  return out;
}

} // namespace chunkseal
