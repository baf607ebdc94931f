// validation.h
#pragma once
#include <nlohmann/json.hpp>

#include "config.h"
#include "types.h"
#include "validation_error.h"

namespace vrpcheck {

// Primary validator on parsed types. Runs every enabled rule in the fixed
// order E1000..E1006 and returns all findings; never stops at the first one.
ValidationResult validate_all(const Problem& problem, const Config& config = {});

// Convenience overload: accept raw JSON (nlohmann::json) and internally parse to types.
// Throws std::runtime_error when the document cannot be mapped to a Problem.
ValidationResult validate_all(const nlohmann::json& problem_json, const Config& config = {});

// Runs a single rule.
ValidationResult run_rule(ErrorCode code, const Problem& problem);

// ---- Plan ----
ValidationResult check_duplicate_job_ids(const Plan& plan);          // E1000
ValidationResult check_demand_balance(const Plan& plan);             // E1001
ValidationResult check_job_time_windows(const Plan& plan);           // E1002

// ---- Fleet ----
ValidationResult check_duplicate_vehicle_types(const Fleet& fleet);  // E1003
ValidationResult check_duplicate_vehicle_ids(const Fleet& fleet);    // E1004
ValidationResult check_vehicle_shift_times(const Fleet& fleet);      // E1005

// ---- Cross references ----
ValidationResult check_relation_references(const Problem& problem);  // E1006

} // namespace vrpcheck
