#include "health/probe_outcome.hpp"

namespace linkwatch::health {

const char* ToString(const FailureKind kind) {
  switch (kind) {
  case FailureKind::kTimeout:
    return "timeout";
  case FailureKind::kUnresolvable:
    return "unresolvable";
  case FailureKind::kOther:
    return "other";
  }
  return "other";
}

bool ParseFailureKind(std::string_view text, FailureKind& kind) {
  if (text == "timeout") {
    kind = FailureKind::kTimeout;
    return true;
  }
  if (text == "unresolvable" || text == "dns") {
    kind = FailureKind::kUnresolvable;
    return true;
  }
  if (text == "other" || text == "fail") {
    kind = FailureKind::kOther;
    return true;
  }
  return false;
}

} // namespace linkwatch::health
