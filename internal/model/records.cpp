#include "internal/model/records.hpp"

#include <stdexcept>
#include <string>

namespace sportsledger::model {

std::string_view ToString(EdgeRealized value) {
  switch (value) {
    case EdgeRealized::kNoSignal:
      return "no_signal";
    case EdgeRealized::kRealized:
      return "realized";
    case EdgeRealized::kMissed:
      return "missed";
  }
  return "unknown";
}

EdgeRealized ParseEdgeRealized(std::string_view text) {
  if (text == "no_signal") return EdgeRealized::kNoSignal;
  if (text == "realized") return EdgeRealized::kRealized;
  if (text == "missed") return EdgeRealized::kMissed;
  throw std::invalid_argument("unknown edge realization: " + std::string(text));
}

} // namespace sportsledger::model
