#pragma once

#include <string>

namespace autopilot::util {

// Random RFC4122 version-4 id in canonical 8-4-4-4-12 lowercase hex form.
// Used for action ids; generation is per-thread and lock free.
std::string NewId();

} // namespace autopilot::util
