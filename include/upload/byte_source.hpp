#ifndef CHUNKSEAL_BYTE_SOURCE_HPP
#define CHUNKSEAL_BYTE_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace chunkseal {

/**
 * @brief Sequential byte input consumed by the chunker.
 *
 * read() returns the number of bytes copied into @p buffer, 0 at end of
 * input, and throws ChunkIOError when the underlying source fails.
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual size_t read(uint8_t *buffer, size_t capacity) = 0;
  virtual std::string describe() const = 0;
};

/** Reads a regular file through a POSIX descriptor. */
class FileByteSource : public ByteSource {
public:
  /**
   * @brief Open @p path for reading.
   * @throws ChunkIOError if the file is missing, unreadable or a directory.
   */
  explicit FileByteSource(const std::string &path);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource &) = delete;
  FileByteSource &operator=(const FileByteSource &) = delete;

  size_t read(uint8_t *buffer, size_t capacity) override;
  std::string describe() const override { return path_; }

private:
  std::string path_;
  int fd_ = -1;
};

/** Adapts a std::istream. The stream must outlive the source. */
class StreamByteSource : public ByteSource {
public:
  explicit StreamByteSource(std::istream &in, std::string name = "<stream>")
      : in_(in), name_(std::move(name)) {}

  size_t read(uint8_t *buffer, size_t capacity) override;
  std::string describe() const override { return name_; }

private:
  std::istream &in_;
  std::string name_;
};

/** Serves bytes from memory without copying them. */
class MemoryByteSource : public ByteSource {
public:
  MemoryByteSource(const uint8_t *data, size_t size)
      : data_(data), size_(size) {}
  explicit MemoryByteSource(const std::vector<uint8_t> &data)
      : data_(data.data()), size_(data.size()) {}

  size_t read(uint8_t *buffer, size_t capacity) override;
  std::string describe() const override { return "<memory>"; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t pos_ = 0;
};

} // namespace chunkseal

#endif // CHUNKSEAL_BYTE_SOURCE_HPP
