// core/errors.cpp - Pipeline failure taxonomy implementation
#include "errors.hpp"
#include "../defs.hpp"

namespace offload {

const char *error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnidentifiedCamera:
    return "UnidentifiedCamera";
  case ErrorKind::CollisionError:
    return "CollisionError";
  case ErrorKind::NoDestinationAvailable:
    return "NoDestinationAvailable";
  case ErrorKind::TransferError:
    return "TransferError";
  case ErrorKind::VerificationError:
    return "VerificationError";
  case ErrorKind::CleanupError:
    return "CleanupError";
  case ErrorKind::ConfigError:
    return "ConfigError";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnidentifiedCamera:
    return EXIT_UNIDENTIFIED;
  case ErrorKind::CollisionError:
    return EXIT_COLLISION;
  case ErrorKind::NoDestinationAvailable:
    return EXIT_NO_DESTINATION;
  case ErrorKind::TransferError:
    return EXIT_TRANSFER;
  case ErrorKind::VerificationError:
    return EXIT_VERIFICATION;
  case ErrorKind::CleanupError:
    // Cleanup problems never fail a run
    return EXIT_OK;
  case ErrorKind::ConfigError:
    return EXIT_CONFIG;
  case ErrorKind::Cancelled:
    return EXIT_CANCELLED;
  }
  return EXIT_INTERNAL;
}

bool OffloadError::retryable() const {
  return kind_ == ErrorKind::NoDestinationAvailable ||
         kind_ == ErrorKind::TransferError;
}

} // namespace offload
