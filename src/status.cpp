// ============================================================================
// status.cpp: string tokens for lanlight::Status
// ============================================================================
#include "lanlight/status.hpp"

namespace lanlight {

const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:                 return "ok";
    case Status::MalformedFrame:     return "malformed_frame";
    case Status::Timeout:            return "timeout";
    case Status::ValidationError:    return "validation_error";
    case Status::NetworkError:       return "network_error";
    case Status::UnsupportedMessage: return "unsupported_message";
    case Status::Cancelled:          return "cancelled";
    case Status::Busy:               return "busy";
  }
  return "unknown";
}

} // namespace lanlight
