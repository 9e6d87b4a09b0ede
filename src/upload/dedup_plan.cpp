#include "upload/dedup_plan.hpp"
#include "upload/upload_constants.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

namespace chunkseal {

DedupQuery makeDedupQuery(const Digest &fileDigest,
                          const std::vector<ChunkBoundary> &boundaries) {
  DedupQuery query;
  query.fileCid = digest_to_cid(fileDigest);
  query.chunkCids.reserve(boundaries.size());
  for (const auto &b : boundaries) {
    query.chunkCids.push_back(hex_to_cid(b.sha256Hex));
  }
  query.boundaries = boundaries;
  query.chunkingAlgorithm = std::string(constants::CDC_ALGORITHM);
  query.gearTableVersion = std::string(constants::CDC_GEAR_TABLE_VERSION);
  return query;
}

DedupPlan planUpload(const std::vector<ChunkBoundary> &boundaries,
                     const std::vector<int64_t> &existingIndices) {
  const int64_t count = static_cast<int64_t>(boundaries.size());
  std::vector<bool> present(boundaries.size(), false);
  for (int64_t index : existingIndices) {
    if (index < 0 || index >= count) {
      raiseContractViolation("Existing chunk index " + std::to_string(index) +
                             " is outside a file of " + std::to_string(count) +
                             " chunks");
    }
    present[static_cast<size_t>(index)] = true;
  }

  DedupPlan plan;
  int64_t totalBytes = 0;
  for (int64_t i = 0; i < count; ++i) {
    const int64_t size = boundaries[static_cast<size_t>(i)].size;
    totalBytes += size;
    if (present[static_cast<size_t>(i)]) {
      plan.existingChunks.push_back(i);
      plan.savedBytes += size;
    } else {
      plan.missingChunks.push_back(i);
    }
  }
  if (totalBytes > 0) {
    plan.dedupRatio =
        static_cast<double>(plan.savedBytes) / static_cast<double>(totalBytes);
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Dedup plan: " +
                                std::to_string(plan.existingChunks.size()) +
                                " chunks present, " +
                                std::to_string(plan.missingChunks.size()) +
                                " to upload, " +
                                std::to_string(plan.savedBytes) +
                                " bytes saved");
  return plan;
}

} // namespace chunkseal
