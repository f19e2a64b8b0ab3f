// core/errors.hpp - Pipeline failure taxonomy
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace offload {

enum class ErrorKind {
  UnidentifiedCamera,
  CollisionError,
  NoDestinationAvailable,
  TransferError,
  VerificationError,
  CleanupError,
  ConfigError,
  Cancelled,
};

const char *error_kind_to_string(ErrorKind kind);
int exit_code_for(ErrorKind kind);

class OffloadError : public std::runtime_error {
public:
  OffloadError(ErrorKind kind, const std::string &message,
               std::string detail = "")
      : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

  ErrorKind kind() const { return kind_; }
  // Extra diagnostics (sampled metadata, mismatch list)
  const std::string &detail() const { return detail_; }
  bool retryable() const;

private:
  ErrorKind kind_;
  std::string detail_;
};

} // namespace offload
