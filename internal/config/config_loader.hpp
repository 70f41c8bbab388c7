#pragma once

#include <string>

#include "config/config.pb.h"

namespace autopilot::config {

/*
  ConfigLoader

  YAML -> google.protobuf.Value -> JSON -> RuntimeConfig. Unknown keys are
  rejected by the JSON parser. Quoted scalars always stay strings, so
  `home_market: "1"` is not read as a number.

  Every loaded config is validated before it is returned:
    - the database backend has what it needs (sqlite path, postgres uri)
    - the server has a bind address
    - logging.level names a spdlog level
    - every threshold section passes BuildSettings (fractions in [0,1],
      positive cooldowns and intervals, pause_roas <= scale_down_max_roas)

  Malformed YAML or JSON throws std::runtime_error; a well-formed config
  that cannot run throws std::invalid_argument.
*/
class ConfigLoader {
 public:
  static autopilot::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static autopilot::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text, const std::string& source = "<inline>");

  static void Validate(const autopilot::runtime::config::RuntimeConfig& config);
};

} // namespace autopilot::config
