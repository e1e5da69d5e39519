#include "dupscan/core/error.hpp"

namespace dupscan {

const char *error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::UsageError:
      return "usage_error";
    case ErrorCode::TraversalError:
      return "traversal_error";
    case ErrorCode::ReadError:
      return "read_error";
    case ErrorCode::PathError:
      return "path_error";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

}  // namespace dupscan
