#ifndef CHUNKSEAL_CONTENT_DEFINED_CHUNKER_HPP
#define CHUNKSEAL_CONTENT_DEFINED_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include <vector>

#include "upload/byte_source.hpp"
#include "upload/cancellation.hpp"
#include "upload/upload_constants.hpp"

namespace chunkseal {

/// One content-defined chunk of a file.
struct ChunkBoundary {
  int64_t offset = 0;    ///< Byte offset of the chunk within the file
  int64_t size = 0;      ///< Chunk length in bytes
  std::string sha256Hex; ///< SHA-256 of exactly [offset, offset + size)
  uint32_t crc32c = 0;   ///< CRC32C of the same range

  bool operator==(const ChunkBoundary &other) const = default;
};

/// Chunk size limits. All sizes are in bytes.
struct ChunkerConfig {
  int64_t minChunkSize = constants::CDC_MIN_CHUNK_SIZE;
  int64_t avgChunkSize = constants::CDC_AVG_CHUNK_SIZE;
  int64_t maxChunkSize = constants::CDC_MAX_CHUNK_SIZE;
  size_t readBufferSize = constants::CDC_READ_BUFFER_SIZE;

  /**
   * @brief Check the limits are usable.
   * @throws ContractViolation unless 0 < min <= avg <= max,
   *         16 <= avg <= 2^61 and the read buffer is non-empty.
   */
  void validate() const;
};

/**
 * @brief FastCDC-style content-defined chunker driven by a gear hash.
 *
 * Boundaries depend only on the bytes of the input. Input is consumed in
 * readBufferSize blocks and each chunk is hashed while it streams past, so
 * memory use does not grow with file size. Instances hold no mutable
 * state and may be used from several threads at once.
 */
class ContentDefinedChunker {
public:
  using BoundaryCallback = std::function<void(const ChunkBoundary &)>;

  /**
   * @throws ContractViolation if @p config is invalid.
   */
  explicit ContentDefinedChunker(ChunkerConfig config = ChunkerConfig{});

  /**
   * @brief Chunk the file at @p path.
   * @throws ChunkIOError if the file cannot be opened or read.
   * @throws OperationCancelled if @p cancel is set between two chunks.
   */
  std::vector<ChunkBoundary>
  chunkFile(const std::string &path,
            const CancellationToken *cancel = nullptr) const;

  /** Chunk everything remaining in @p in. */
  std::vector<ChunkBoundary>
  chunkStream(std::istream &in, const CancellationToken *cancel = nullptr) const;

  /** Chunk an in-memory buffer. */
  std::vector<ChunkBoundary> chunkBuffer(const uint8_t *data,
                                         size_t size) const;

  /**
   * @brief Chunk @p source, handing each boundary to @p onBoundary as soon
   * as it is complete.
   *
   * Unlike the collecting variants, boundaries already delivered stay
   * delivered if a later read fails or the call is cancelled.
   * @return Total number of bytes consumed.
   */
  int64_t chunkEach(ByteSource &source, const BoundaryCallback &onBoundary,
                    const CancellationToken *cancel = nullptr) const;

  const ChunkerConfig &config() const { return config_; }
  int maskBits() const { return maskBits_; }
  uint64_t hardMask() const { return hardMask_; }
  uint64_t easyMask() const { return easyMask_; }

private:
  std::vector<ChunkBoundary> collect(ByteSource &source,
                                     const CancellationToken *cancel) const;

  ChunkerConfig config_;
  int maskBits_;
  uint64_t hardMask_; // used while the chunk is shorter than avg
  uint64_t easyMask_; // used once the chunk reached avg
};

} // namespace chunkseal

#endif // CHUNKSEAL_CONTENT_DEFINED_CHUNKER_HPP
