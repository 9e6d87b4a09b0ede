#ifndef CHUNKSEAL_UPLOAD_CONSTANTS_HPP
#define CHUNKSEAL_UPLOAD_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

// Values in this header bind wire and behavioral compatibility between
// clients and servers. Changing any of them changes chunk boundaries, tree
// roots or commitments.
namespace chunkseal::constants {

// Content-defined chunking
inline constexpr int64_t CDC_MIN_CHUNK_SIZE = 256 * 1024;
inline constexpr int64_t CDC_AVG_CHUNK_SIZE = 1024 * 1024;
inline constexpr int64_t CDC_MAX_CHUNK_SIZE = 8 * 1024 * 1024;
inline constexpr size_t CDC_READ_BUFFER_SIZE = 1024 * 1024;
inline constexpr int64_t CDC_MAX_AVG_CHUNK_SIZE = int64_t{1} << 61;
inline constexpr std::string_view CDC_GEAR_TABLE_SEED =
    "Aether3D_CDC_GearTable_v1";
inline constexpr std::string_view CDC_ALGORITHM = "fastcdc";
inline constexpr std::string_view CDC_GEAR_TABLE_VERSION = "v1";

// Merkle tree domain tags
inline constexpr uint8_t MERKLE_LEAF_PREFIX = 0x00;
inline constexpr uint8_t MERKLE_NODE_PREFIX = 0x01;

// Commitment chain domains; the chain and jump domains end in a NUL byte.
inline constexpr std::string_view COMMITMENT_CHAIN_GENESIS_PREFIX =
    "Aether3D_CC_GENESIS";
inline constexpr std::string_view COMMITMENT_CHAIN_DOMAIN{"CCv1\0", 5};
inline constexpr std::string_view COMMITMENT_CHAIN_JUMP_DOMAIN{"CCv1_JUMP\0",
                                                               10};

// Verification
inline constexpr double DEFAULT_COVERAGE_THRESHOLD = 0.999;
inline constexpr int64_t POP_MEDIUM_FILE_BYTES = 100LL * 1024 * 1024;
inline constexpr int64_t POP_LARGE_FILE_BYTES = 1024LL * 1024 * 1024;
inline constexpr int POP_SMALL_CHALLENGES = 5;
inline constexpr int POP_MEDIUM_CHALLENGES = 8;
inline constexpr int POP_LARGE_CHALLENGES = 12;

} // namespace chunkseal::constants

#endif // CHUNKSEAL_UPLOAD_CONSTANTS_HPP
