#pragma once
#include <string>

namespace clip_service {

enum class ErrorKind {
  InvalidInput,
  Configuration,
  Fetch,
  EmptyArtifact,
  Transfer,
  Issuance,
  Cancelled,
  Timeout,
  NotFound,
  QueueFull
};

struct JobError {
  ErrorKind kind;
  std::string message;
};

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidInput: return "invalid_input";
    case ErrorKind::Configuration: return "configuration";
    case ErrorKind::Fetch: return "fetch";
    case ErrorKind::EmptyArtifact: return "empty_artifact";
    case ErrorKind::Transfer: return "transfer";
    case ErrorKind::Issuance: return "issuance";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::QueueFull: return "queue_full";
  }
  return "unknown";
}

} // namespace clip_service
