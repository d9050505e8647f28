#ifndef FERRY_ENGINE_ERRORS_HPP
#define FERRY_ENGINE_ERRORS_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace ferry {
namespace engine {

/**
 * Classification of a meta-request failure.
 * Only TRANSPORT (and REMOTE_SERVICE on an allowlisted status) is retried.
 */
enum class ErrorKind {
  NONE,
  TRANSPORT,
  CHECKSUM_MISMATCH,
  PLANNING,
  REMOTE_SERVICE,
  RESUME_STATE,
  ABORT_FAILURE,
  SIGNING,
  CANCELLED
};

const char* toString(ErrorKind kind);

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  return os << toString(kind);
}

/**
 * Error detail carried through asynchronous completion paths
 */
struct ErrorInfo {
  ErrorKind kind = ErrorKind::NONE;
  std::string message;
  std::string error_code;  // S3 error code, e.g. "NoSuchUpload"
  int http_status = 0;
  uint32_t part_number = 0;  // 0 when not tied to a part

  bool ok() const { return kind == ErrorKind::NONE; }

  static ErrorInfo make(
    ErrorKind kind, const std::string& message, const std::string& code = "", int status = 0,
    uint32_t part_number = 0
  ) {
    return {kind, message, code, status, part_number};
  }

  std::string describe() const;
};

/**
 * Base for synchronous engine failures
 */
class FerryError : public std::runtime_error {
public:
  FerryError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message)
      , kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

/**
 * Malformed descriptor, raised before any request is sent
 */
class PlanningError : public FerryError {
public:
  explicit PlanningError(const std::string& message)
      : FerryError(ErrorKind::PLANNING, message) {}
};

/**
 * Resume token that cannot be parsed or does not fit the request
 */
class ResumeStateError : public FerryError {
public:
  explicit ResumeStateError(const std::string& message)
      : FerryError(ErrorKind::RESUME_STATE, message) {}
};

/**
 * Wire integer that maps to no known enumerator
 */
class UnknownVariantError : public FerryError {
public:
  UnknownVariantError(const std::string& type_name, int value)
      : FerryError(
          ErrorKind::PLANNING, "Unknown " + type_name + " value: " + std::to_string(value)
        )
      , type_name_(type_name)
      , value_(value) {}

  const std::string& typeName() const { return type_name_; }
  int value() const { return value_; }

private:
  std::string type_name_;
  int value_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_ERRORS_HPP
