#ifndef CHUNKSEAL_CID_UTILS_HPP
#define CHUNKSEAL_CID_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "utilities/digest.hpp"

namespace chunkseal {

// CIDv1 (0x01), raw binary multicodec (0x55), SHA2-256 (0x12), 32 bytes.
extern const std::vector<uint8_t> CID_PREFIX_SHA256;

/**
 * @brief Converts a chunk digest to a base32 CIDv1 string.
 * @param digest SHA-256 of the chunk.
 * @return The CIDv1 string.
 */
std::string digest_to_cid(const Digest &digest);

/**
 * @brief Converts a CIDv1 string back to its digest.
 * @param cid The CIDv1 string.
 * @return The extracted digest.
 * @throws ContractViolation if the CID is malformed or not a SHA2-256 CID.
 */
Digest cid_to_digest(const std::string &cid);

/**
 * @brief Convert a hex chunk hash directly to its CID.
 */
std::string hex_to_cid(const std::string &hex);

} // namespace chunkseal

#endif // CHUNKSEAL_CID_UTILS_HPP
