// config.h
#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "validation_error.h"

namespace vrpcheck {

struct Config {
  // From the JSON config keys:
  // {"PARALLEL_CHECKS", false}, {"DISABLED_RULES", []}, {"LOG_PROGRESS", true}, {"REPORT_OUT", ""}
  bool parallel_checks = false;          // one std::async task per rule
  std::vector<ErrorCode> disabled_rules; // skipped by validate_all
  bool log_progress = true;              // CLI only, the engine never logs
  std::string report_out;                // used when --out is not given

  bool is_enabled(ErrorCode code) const;
};

// Throws std::runtime_error on wrong types or unknown rule codes.
Config parse_config(const nlohmann::json& j);

} // namespace vrpcheck
