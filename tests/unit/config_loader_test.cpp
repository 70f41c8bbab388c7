#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/settings.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "autopilot_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\autopilot\\\"quoted\"\\db.sqlite"
)");

  auto config = autopilot::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\autopilot\\\"quoted\"\\db.sqlite");
  assert(config.server().bind_address() == "0.0.0.0:50061");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  memory: {}
)");

  auto config = autopilot::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
database:
  sqlite:
    path: "/tmp/autopilot.db"
)");

  bool threw = false;
  try {
    (void)autopilot::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestThresholdSectionsOverrideDefaults() {
  const auto yaml_path = WriteYaml("thresholds",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  memory: {}
optimizer:
  scale_up_min_roas: 2.5
  cooldown_hours: 12
policy:
  max_auto_change_pct: 0.15
  home_market: "FR"
safety:
  min_impressions: 2500
worker:
  enabled: false
  mode: "auto"
  interval_seconds: 600
)");

  const auto config   = autopilot::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto settings = autopilot::config::BuildSettings(config);

  assert(settings.optimizer.scale_up_min_roas == 2.5);
  assert(settings.optimizer.cooldown_hours == 12);
  assert(settings.policy.max_auto_change_pct == 0.15);
  assert(settings.policy.home_market == "FR");
  assert(settings.safety.min_impressions == 2500);
  assert(!settings.worker.enabled);
  assert(settings.worker.mode == autopilot::config::WorkerMode::kAuto);
  assert(settings.worker.interval_seconds == 600);

  // untouched fields keep their defaults
  assert(settings.optimizer.scale_down_max_roas == 1.5);
  assert(settings.policy.max_daily_change_pct == 0.20);
  assert(settings.safety.min_age_hours == 48);
  assert(settings.roas.min_sample_size == 30);
  assert(settings.prediction.ema_alpha == 0.3);
}

template <typename Exception>
bool ParseThrows(const std::string& yaml) {
  try {
    (void)autopilot::config::ConfigLoader::ParseYaml(yaml);
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestOutOfRangeThresholdIsRejected() {
  const auto yaml_path = WriteYaml("bad_alpha",
                                   R"(database:
  memory: {}
prediction:
  ema_alpha: 1.5
)");

  bool threw = false;
  try {
    (void)autopilot::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::invalid_argument& e) {
    threw = std::string(e.what()).find("prediction.ema_alpha") != std::string::npos;
  }
  assert(threw);

  assert(ParseThrows<std::invalid_argument>("policy:\n  max_auto_change_pct: -0.1\n"));
  assert(ParseThrows<std::invalid_argument>("worker:\n  auto_min_confidence: 1.2\n"));
}

void TestNonPositiveCooldownIsRejected() {
  assert(ParseThrows<std::invalid_argument>("optimizer:\n  cooldown_hours: 0\n"));
  assert(ParseThrows<std::invalid_argument>("safety:\n  action_cooldown_hours: 0\n"));
  assert(ParseThrows<std::invalid_argument>("worker:\n  interval_seconds: 0\n"));
}

void TestUnknownWorkerModeIsRejected() {
  assert(ParseThrows<std::invalid_argument>("worker:\n  mode: \"yolo\"\n"));
}

void TestUnusableDatabaseAndLoggingAreRejected() {
  assert(ParseThrows<std::invalid_argument>("database:\n  sqlite:\n    path: \"\"\n"));
  assert(ParseThrows<std::invalid_argument>("database:\n  postgres:\n    max_connections: 4\n"));
  assert(ParseThrows<std::invalid_argument>("server:\n  bind_address: \"\"\n"));
  assert(ParseThrows<std::invalid_argument>("logging:\n  level: \"loud\"\n"));
  assert(ParseThrows<std::runtime_error>("- just\n- a list\n"));
}

void TestQuotedScalarsStayStrings() {
  const auto config = autopilot::config::ConfigLoader::ParseYaml(R"(policy:
  home_market: "1"
logging:
  level: "warn"
)");
  assert(config.policy().home_market() == "1");
  assert(config.logging().level() == "warn");
}

void TestEmptyDocumentLoadsDefaults() {
  const auto config   = autopilot::config::ConfigLoader::ParseYaml("");
  const auto settings = autopilot::config::BuildSettings(config);
  assert(!config.database().has_sqlite());
  assert(settings.worker.mode == autopilot::config::WorkerMode::kSuggest);
  assert(settings.optimizer.cooldown_hours == 24);
}

void TestPauseRoasAboveScaleDownIsRejected() {
  autopilot::runtime::config::RuntimeConfig config;
  config.mutable_optimizer()->set_pause_roas(2.0);
  config.mutable_optimizer()->set_scale_down_max_roas(1.0);

  bool threw = false;
  try {
    (void)autopilot::config::BuildSettings(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestThresholdSectionsOverrideDefaults();
  TestOutOfRangeThresholdIsRejected();
  TestNonPositiveCooldownIsRejected();
  TestUnknownWorkerModeIsRejected();
  TestUnusableDatabaseAndLoggingAreRejected();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentLoadsDefaults();
  TestPauseRoasAboveScaleDownIsRejected();

  std::cout << "autopilot_unit_config_loader: pass\n";
  return 0;
}
