#pragma once

#include <iomanip>
#include <sstream>
#include <string>

namespace autopilot::util {

inline std::string FormatFixed(double value, int places) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(places) << value;
  return os.str();
}

// 0.25 -> "25.0%"
inline std::string FormatPercent(double fraction, int places = 1) {
  return FormatFixed(fraction * 100.0, places) + "%";
}

inline std::string FormatUsd(double value) {
  return "$" + FormatFixed(value, 2);
}

} // namespace autopilot::util
