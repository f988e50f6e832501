#pragma once

#include <exception>
#include <string>

namespace media_core {

enum class ErrorKind { NotFound, InvalidArgument, ExternalServiceFailure, IOFailure };

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:
      return "NOT_FOUND";
    case ErrorKind::InvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorKind::ExternalServiceFailure:
      return "EXTERNAL_SERVICE_FAILURE";
    case ErrorKind::IOFailure:
      return "IO_FAILURE";
    default:
      return "UNKNOWN";
  }
}

class MediaError : public std::exception {
 public:
  MediaError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

class NotFoundError : public MediaError {
 public:
  explicit NotFoundError(const std::string &message) : MediaError(ErrorKind::NotFound, message) {}
};

class InvalidArgumentError : public MediaError {
 public:
  explicit InvalidArgumentError(const std::string &message)
      : MediaError(ErrorKind::InvalidArgument, message) {}
};

// Embedding Provider or Frame Extractor unreachable or misbehaving
class ExternalServiceError : public MediaError {
 public:
  explicit ExternalServiceError(const std::string &message)
      : MediaError(ErrorKind::ExternalServiceFailure, message) {}
};

class StorageIOError : public MediaError {
 public:
  explicit StorageIOError(const std::string &message) : MediaError(ErrorKind::IOFailure, message) {}
};

}  // namespace media_core
