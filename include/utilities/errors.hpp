#ifndef CHUNKSEAL_ERRORS_HPP
#define CHUNKSEAL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace chunkseal {

/**
 * @brief Raised when a caller breaks an API contract.
 *
 * Malformed hash encodings, out-of-range indices and invalid sizes all end
 * up here. The object that detected the violation is left unchanged.
 */
class ContractViolation : public std::invalid_argument {
public:
  explicit ContractViolation(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief Raised when a chunk source cannot be opened or read.
 *
 * The failure is retryable once the underlying condition is fixed.
 */
class ChunkIOError : public std::runtime_error {
public:
  ChunkIOError(const std::string &path, int errorCode,
               const std::string &message)
      : std::runtime_error(message + " (" + path + ")"), path_(path),
        errorCode_(errorCode) {}

  const std::string &path() const { return path_; }
  int errorCode() const { return errorCode_; }

private:
  std::string path_;
  int errorCode_;
};

/**
 * @brief Log @p what at WARN and throw it as a ContractViolation.
 */
[[noreturn]] void raiseContractViolation(const std::string &what);

/** Raised when a cooperative cancellation request is observed. */
class OperationCancelled : public std::runtime_error {
public:
  explicit OperationCancelled(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace chunkseal

#endif // CHUNKSEAL_ERRORS_HPP
