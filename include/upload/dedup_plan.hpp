#ifndef CHUNKSEAL_DEDUP_PLAN_HPP
#define CHUNKSEAL_DEDUP_PLAN_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "upload/content_defined_chunker.hpp"
#include "utilities/digest.hpp"

namespace chunkseal {

/// Question sent to a server: which of these chunks do you already hold?
struct DedupQuery {
  std::string fileCid;
  std::vector<std::string> chunkCids; ///< One CID per boundary, in order
  std::vector<ChunkBoundary> boundaries;
  std::string chunkingAlgorithm;
  std::string gearTableVersion;
};

/// Split of a file's chunks into those to skip and those to send.
struct DedupPlan {
  std::vector<int64_t> existingChunks;
  std::vector<int64_t> missingChunks;
  int64_t savedBytes = 0;
  double dedupRatio = 0.0; ///< savedBytes / file size, 0 for an empty file
};

/**
 * @brief Build the dedup query for a chunked file.
 * @throws ContractViolation if a boundary carries a malformed hash.
 */
DedupQuery makeDedupQuery(const Digest &fileDigest,
                          const std::vector<ChunkBoundary> &boundaries);

/**
 * @brief Combine the server's answer with the local boundaries.
 * @param existingIndices Indices the server already holds; duplicates are
 *        ignored.
 * @throws ContractViolation for an index outside the boundary list.
 */
DedupPlan planUpload(const std::vector<ChunkBoundary> &boundaries,
                     const std::vector<int64_t> &existingIndices);

} // namespace chunkseal

#endif // CHUNKSEAL_DEDUP_PLAN_HPP
