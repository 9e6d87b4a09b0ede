#include "upload/byte_source.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chunkseal {

FileByteSource::FileByteSource(const std::string &path) : path_(path) {
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    int err = errno;
    Logger::getInstance().log(LogLevel::ERROR, "Failed to open " + path +
                                                   ": " + std::strerror(err));
    throw ChunkIOError(path, err,
                       std::string("Cannot open file: ") + std::strerror(err));
  }
  struct stat st {};
  if (::fstat(fd_, &st) != 0 || S_ISDIR(st.st_mode)) {
    int err = S_ISDIR(st.st_mode) ? EISDIR : errno;
    ::close(fd_);
    fd_ = -1;
    Logger::getInstance().log(LogLevel::ERROR, "Not a readable file: " + path);
    throw ChunkIOError(path, err,
                       std::string("Not a readable file: ") +
                           std::strerror(err));
  }
}

FileByteSource::~FileByteSource() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

size_t FileByteSource::read(uint8_t *buffer, size_t capacity) {
  while (true) {
    ssize_t n = ::read(fd_, buffer, capacity);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    int err = errno;
    Logger::getInstance().log(LogLevel::ERROR, "Read failed on " + path_ +
                                                   ": " + std::strerror(err));
    throw ChunkIOError(path_, err,
                       std::string("Read failed: ") + std::strerror(err));
  }
}

size_t StreamByteSource::read(uint8_t *buffer, size_t capacity) {
  // failbit without eofbit means the stream never opened or a previous
  // read failed; only eofbit marks a clean end.
  if (in_.bad() || (in_.fail() && !in_.eof())) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Stream " + name_ + " is not readable");
    throw ChunkIOError(name_, EIO, "Stream is not readable");
  }
  if (in_.eof()) {
    return 0;
  }
  in_.read(reinterpret_cast<char *>(buffer),
           static_cast<std::streamsize>(capacity));
  if (in_.bad() || (in_.fail() && !in_.eof())) {
    Logger::getInstance().log(LogLevel::ERROR, "Stream read failed on " + name_);
    throw ChunkIOError(name_, EIO, "Stream read failed");
  }
  return static_cast<size_t>(in_.gcount());
}

size_t MemoryByteSource::read(uint8_t *buffer, size_t capacity) {
  size_t n = std::min(capacity, size_ - pos_);
  if (n > 0) {
    std::memcpy(buffer, data_ + pos_, n);
    pos_ += n;
  }
  return n;
}

} // namespace chunkseal
