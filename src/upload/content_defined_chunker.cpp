#include "upload/content_defined_chunker.hpp"
#include "upload/gear_table.hpp"
#include "utilities/block_hasher.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

namespace chunkseal {

void ChunkerConfig::validate() const {
  if (minChunkSize <= 0 || avgChunkSize <= 0 || maxChunkSize <= 0) {
    raiseContractViolation("Chunk sizes must be positive (min=" +
                           std::to_string(minChunkSize) +
                           ", avg=" + std::to_string(avgChunkSize) +
                           ", max=" + std::to_string(maxChunkSize) + ")");
  }
  if (minChunkSize > avgChunkSize || avgChunkSize > maxChunkSize) {
    raiseContractViolation("Chunk sizes must satisfy min <= avg <= max (min=" +
                           std::to_string(minChunkSize) +
                           ", avg=" + std::to_string(avgChunkSize) +
                           ", max=" + std::to_string(maxChunkSize) + ")");
  }
  if (avgChunkSize < 16) {
    raiseContractViolation("Average chunk size must be at least 16 bytes");
  }
  // The hard mask spans log2(avg) + 2 bits of the 64-bit gear hash.
  if (avgChunkSize > constants::CDC_MAX_AVG_CHUNK_SIZE) {
    raiseContractViolation("Average chunk size must be at most " +
                           std::to_string(constants::CDC_MAX_AVG_CHUNK_SIZE) +
                           " bytes, got " + std::to_string(avgChunkSize));
  }
  if (readBufferSize == 0) {
    raiseContractViolation("Read buffer size must be positive");
  }
}

static int floorLog2(int64_t value) {
  int bits = 0;
  while (bits < 61 && (int64_t{1} << (bits + 1)) <= value) {
    ++bits;
  }
  return bits;
}

ContentDefinedChunker::ContentDefinedChunker(ChunkerConfig config)
    : config_(config) {
  config_.validate();
  maskBits_ = floorLog2(config_.avgChunkSize);
  hardMask_ = (uint64_t{1} << (maskBits_ + 2)) - 1;
  easyMask_ = (uint64_t{1} << (maskBits_ - 2)) - 1;
  // Touch the table so the one-time derivation is not charged to the first
  // chunk of the first file.
  (void)gearTable();
}

int64_t ContentDefinedChunker::chunkEach(
    ByteSource &source, const BoundaryCallback &onBoundary,
    const CancellationToken *cancel) const {
  const GearTable &gear = gearTable();
  const int64_t minSize = config_.minChunkSize;
  const int64_t avgSize = config_.avgChunkSize;
  const int64_t maxSize = config_.maxChunkSize;

  if (cancel && cancel->isCancelled()) {
    throw OperationCancelled("Chunking of " + source.describe() +
                             " cancelled");
  }

  std::vector<uint8_t> buffer(config_.readBufferSize);
  BlockHasher hasher;
  uint64_t gearHash = 0;
  int64_t chunkStart = 0;
  int64_t chunkLen = 0;
  int64_t emitted = 0;

  auto emit = [&]() {
    DigestResult dr = hasher.finalize_hashed();
    ChunkBoundary boundary{chunkStart, chunkLen, dr.hex, dr.crc32c};
    Logger::trace("chunk %lld offset=%lld size=%lld sha256=%s",
                  static_cast<long long>(emitted),
                  static_cast<long long>(boundary.offset),
                  static_cast<long long>(boundary.size), dr.hex.c_str());
    onBoundary(boundary);
    ++emitted;
    chunkStart += chunkLen;
    chunkLen = 0;
    gearHash = 0;
    hasher.reset();
    if (cancel && cancel->isCancelled()) {
      throw OperationCancelled("Chunking of " + source.describe() +
                               " cancelled after " + std::to_string(emitted) +
                               " chunks");
    }
  };

  while (true) {
    const size_t got = source.read(buffer.data(), buffer.size());
    if (got == 0) {
      break;
    }

    const uint8_t *data = buffer.data();
    size_t sliceStart = 0;
    for (size_t i = 0; i < got; ++i) {
      gearHash = (gearHash << 1) ^ gear[data[i]];
      ++chunkLen;

      bool cut;
      if (chunkLen >= maxSize) {
        cut = true;
      } else if (chunkLen < minSize) {
        cut = false;
      } else {
        const uint64_t mask = chunkLen < avgSize ? hardMask_ : easyMask_;
        cut = (gearHash & mask) == 0;
      }

      if (cut) {
        hasher.ingest(data + sliceStart, i + 1 - sliceStart);
        sliceStart = i + 1;
        emit();
      }
    }
    if (sliceStart < got) {
      hasher.ingest(data + sliceStart, got - sliceStart);
    }
  }

  if (chunkLen > 0) {
    emit();
  }

  Logger::getInstance().log(LogLevel::DEBUG,
                            "Chunked " + source.describe() + ": " +
                                std::to_string(chunkStart) + " bytes into " +
                                std::to_string(emitted) + " chunks");
  return chunkStart;
}

std::vector<ChunkBoundary>
ContentDefinedChunker::collect(ByteSource &source,
                               const CancellationToken *cancel) const {
  std::vector<ChunkBoundary> boundaries;
  chunkEach(
      source,
      [&boundaries](const ChunkBoundary &b) { boundaries.push_back(b); },
      cancel);
  return boundaries;
}

std::vector<ChunkBoundary>
ContentDefinedChunker::chunkFile(const std::string &path,
                                 const CancellationToken *cancel) const {
  FileByteSource source(path);
  return collect(source, cancel);
}

std::vector<ChunkBoundary>
ContentDefinedChunker::chunkStream(std::istream &in,
                                   const CancellationToken *cancel) const {
  StreamByteSource source(in);
  return collect(source, cancel);
}

std::vector<ChunkBoundary>
ContentDefinedChunker::chunkBuffer(const uint8_t *data, size_t size) const {
  MemoryByteSource source(data, size);
  return collect(source, nullptr);
}

} // namespace chunkseal
