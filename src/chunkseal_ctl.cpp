#include "upload/content_defined_chunker.hpp"
#include "upload/integrity_session.hpp"
#include "upload/streaming_merkle_tree.hpp"
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/self_test.h"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace chunkseal;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_IO_ERROR = 2;

void usage() {
  std::cout << "Usage: chunkseal chunk <file>\n"
            << "       chunkseal manifest <file> <sessionId>\n"
            << "       chunkseal prove <file> <index>\n"
            << "       chunkseal selftest\n";
}

std::string crcHex(uint32_t crc) {
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", crc);
  return buf;
}

int chunk_command(const ContentDefinedChunker &chunker,
                  const std::string &path) {
  auto boundaries = chunker.chunkFile(path);
  std::cout << "Index\tOffset\tSize\tSHA256\tCRC32C" << std::endl;
  for (size_t i = 0; i < boundaries.size(); ++i) {
    const auto &b = boundaries[i];
    std::cout << i << '\t' << b.offset << '\t' << b.size << '\t'
              << b.sha256Hex << '\t' << crcHex(b.crc32c) << std::endl;
  }
  return EXIT_OK;
}

int manifest_command(const ContentDefinedChunker &chunker,
                     const std::string &path, const std::string &sessionId) {
  IntegritySession session(sessionId);
  FileByteSource source(path);
  chunker.chunkEach(source,
                    [&session](const ChunkBoundary &b) { session.ingest(b); });
  SessionManifest m = session.manifest();

  std::cout << "Session: " << m.sessionId << std::endl;
  std::cout << "Chunks: " << m.chunkCount << std::endl;
  std::cout << "Bytes: " << m.totalBytes << std::endl;
  std::cout << "Merkle root: " << m.merkleRootHex << std::endl;
  std::cout << "Latest commitment: " << m.latestCommitmentHex << std::endl;
  std::cout << "Jump entries:" << std::endl;
  for (const auto &[index, hex] : m.jumpEntries) {
    std::cout << "  " << index << '\t' << hex << std::endl;
  }
  return EXIT_OK;
}

int prove_command(const ContentDefinedChunker &chunker,
                  const std::string &path, const std::string &indexArg) {
  int64_t index = 0;
  try {
    index = std::stoll(indexArg);
  } catch (const std::logic_error &e) {
    std::cerr << "Invalid index: " << indexArg << ". " << e.what()
              << std::endl;
    return EXIT_USAGE;
  }

  StreamingMerkleTree tree;
  for (const auto &b : chunker.chunkFile(path)) {
    tree.appendChunk(b);
  }
  auto proof = tree.generateProof(index);
  auto leaf = tree.leafHashAt(index);
  if (!proof || !leaf) {
    std::cerr << "Index " << index << " is outside a tree of "
              << tree.leafCount() << " leaves" << std::endl;
    return EXIT_USAGE;
  }

  const Digest root = tree.rootHash();
  std::cout << "Leaf " << index << ": " << toHex(*leaf) << std::endl;
  for (size_t i = 0; i < proof->size(); ++i) {
    std::cout << "  proof[" << i << "] " << toHex((*proof)[i]) << std::endl;
  }
  std::cout << "Root: " << toHex(root) << std::endl;
  bool ok = StreamingMerkleTree::verifyProof(*leaf, *proof, root, index,
                                             tree.leafCount());
  std::cout << (ok ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  return ok ? EXIT_OK : EXIT_USAGE;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return EXIT_USAGE;
  }

  RuntimeOptions opts;
  try {
    opts = loadRuntimeOptions();
    Logger::init(opts.logFile, opts.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return EXIT_USAGE;
  }

  if (!integrity_self_test()) {
    std::cerr << "Self test FAILED" << std::endl;
    return EXIT_USAGE;
  }

  const std::string cmd = argv[1];
  try {
    ContentDefinedChunker chunker(opts.chunker);
    if (cmd == "selftest") {
      std::cout << "Self test passed" << std::endl;
      return EXIT_OK;
    } else if (cmd == "chunk" && argc == 3) {
      return chunk_command(chunker, argv[2]);
    } else if (cmd == "manifest" && argc == 4) {
      return manifest_command(chunker, argv[2], argv[3]);
    } else if (cmd == "prove" && argc == 4) {
      return prove_command(chunker, argv[2], argv[3]);
    }
  } catch (const ChunkIOError &e) {
    std::cerr << "I/O error: " << e.what() << std::endl;
    return EXIT_IO_ERROR;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_USAGE;
  }

  usage();
  return EXIT_USAGE;
}
