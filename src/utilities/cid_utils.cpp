#include "utilities/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp" // For Base32 encoding/decoding
#include "utilities/errors.hpp"

#include <algorithm>
#include <exception>

namespace chunkseal {

const std::vector<uint8_t> CID_PREFIX_SHA256 = {0x01, 0x55, 0x12, 0x20};

std::string digest_to_cid(const Digest &digest) {
  std::vector<uint8_t> bytes_to_encode;
  bytes_to_encode.reserve(CID_PREFIX_SHA256.size() + digest.size());
  bytes_to_encode.insert(bytes_to_encode.end(), CID_PREFIX_SHA256.begin(),
                         CID_PREFIX_SHA256.end());
  bytes_to_encode.insert(bytes_to_encode.end(), digest.begin(), digest.end());

  return cppcodec::base32_rfc4648::encode(bytes_to_encode);
}

Digest cid_to_digest(const std::string &cid) {
  if (cid.empty()) {
    raiseContractViolation("CID string cannot be empty.");
  }

  std::vector<uint8_t> decoded_bytes;
  try {
    decoded_bytes = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const std::exception &e) {
    raiseContractViolation("Failed to decode Base32 CID: " +
                           std::string(e.what()));
  }

  if (decoded_bytes.size() < CID_PREFIX_SHA256.size()) {
    raiseContractViolation(
        "Invalid CID: Decoded data too short to contain prefix.");
  }
  if (!std::equal(CID_PREFIX_SHA256.begin(), CID_PREFIX_SHA256.end(),
                  decoded_bytes.begin())) {
    raiseContractViolation("Invalid CID: Prefix mismatch.");
  }
  if (decoded_bytes.size() != CID_PREFIX_SHA256.size() + DIGEST_SIZE) {
    raiseContractViolation("Invalid CID: Decoded data length does not match "
                           "expected digest size.");
  }

  Digest digest{};
  std::copy(decoded_bytes.begin() + CID_PREFIX_SHA256.size(),
            decoded_bytes.end(), digest.begin());
  return digest;
}

std::string hex_to_cid(const std::string &hex) {
  return digest_to_cid(digestFromHex(hex));
}

} // namespace chunkseal
