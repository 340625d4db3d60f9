#include "cuid2/core/result.h"

#include <sstream>

namespace cuid2::core {

std::string to_string(const CuidError& error) {
  std::ostringstream oss;
  switch (error.kind) {
    case CuidErrorKind::kInvalidLength:
      oss << "Invalid CUID length: " << error.requested << ", expected between "
          << error.min_length << " and " << error.max_length;
      break;
    case CuidErrorKind::kClock:
      oss << "System time error: " << error.detail;
      break;
    case CuidErrorKind::kRandomSource:
      oss << "Random source error: " << error.detail;
      break;
  }
  return oss.str();
}

}  // namespace cuid2::core
