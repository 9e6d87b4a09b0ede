#include "upload/chunk_commitment_chain.hpp"
#include "upload/content_defined_chunker.hpp"
#include "upload/streaming_merkle_tree.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <vector>

// Deterministic pseudo-random payload so runs are comparable.
std::vector<uint8_t> create_random_bytes(size_t size, uint32_t seed) {
  std::vector<uint8_t> vec(size);
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto &b : vec) {
    b = static_cast<uint8_t>(dist(gen));
  }
  return vec;
}

int main() {
  const size_t total_size_bytes = 256ULL * 1024 * 1024; // 256 MiB

  std::cout << "Preparing " << total_size_bytes / (1024 * 1024)
            << " MiB of data..." << std::endl;
  std::vector<uint8_t> data = create_random_bytes(total_size_bytes, 42);
  std::cout << "Data preparation complete." << std::endl;

  chunkseal::ContentDefinedChunker chunker;

  // --- Benchmarking chunking ---
  auto chunk_start = std::chrono::high_resolution_clock::now();
  auto boundaries = chunker.chunkBuffer(data.data(), data.size());
  auto chunk_end = std::chrono::high_resolution_clock::now();
  std::chrono::duration<double> chunk_duration = chunk_end - chunk_start;

  // --- Benchmarking tree and chain over the chunk hashes ---
  auto seal_start = std::chrono::high_resolution_clock::now();
  chunkseal::StreamingMerkleTree tree;
  chunkseal::ChunkCommitmentChain chain("bench");
  for (const auto &b : boundaries) {
    tree.appendChunk(b);
    chain.appendChunk(b.sha256Hex);
  }
  auto root = tree.rootHex();
  auto seal_end = std::chrono::high_resolution_clock::now();
  std::chrono::duration<double> seal_duration = seal_end - seal_start;

  double total_mb = static_cast<double>(total_size_bytes) / (1024 * 1024);

  std::cout << "--- Chunker Benchmark Results ---" << std::endl;
  std::cout << "Total data processed: " << total_mb << " MiB" << std::endl;
  std::cout << "Chunks: " << boundaries.size() << " (average "
            << (boundaries.empty() ? 0 : total_size_bytes / boundaries.size())
            << " bytes)" << std::endl;
  std::cout << "Chunking time: " << chunk_duration.count() << " seconds"
            << std::endl;
  std::cout << "Tree + chain time: " << seal_duration.count() << " seconds"
            << std::endl;
  std::cout << "Merkle root: " << root << std::endl;
  std::cout << "Latest commitment: " << chain.getLatestCommitment()
            << std::endl;

  if (chunk_duration.count() > 0) {
    std::cout << "Throughput (chunk + hash): "
              << total_mb / chunk_duration.count() << " MiB/s" << std::endl;
  } else {
    std::cout << "Throughput (chunk + hash): N/A (duration was zero)"
              << std::endl;
  }
  return 0;
}
