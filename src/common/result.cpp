#include "commitas/common/result.hpp"

namespace commitas::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Usage:
    return "usage";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Duplicate:
    return "duplicate";
  case ErrorKind::Config:
    return "config";
  case ErrorKind::Store:
    return "store";
  case ErrorKind::ExternalProcess:
    return "external_process";
  }
  return "unknown";
}

} // namespace commitas::common
