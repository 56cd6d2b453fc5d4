#include "sidecar/common/result.hpp"

namespace sidecar::common {

std::string error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Generic:
    return "generic";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::SessionNotFound:
    return "session_not_found";
  case ErrorCode::SessionRead:
    return "session_read";
  case ErrorCode::Summarizer:
    return "summarizer";
  case ErrorCode::Persistence:
    return "persistence";
  case ErrorCode::Config:
    return "config";
  case ErrorCode::Spawn:
    return "spawn";
  }
  return "generic";
}

} // namespace sidecar::common
