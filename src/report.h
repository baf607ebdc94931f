// report.h
#pragma once
#include <nlohmann/json.hpp>

#include "types.h"
#include "validation_error.h"

namespace vrpcheck {

nlohmann::json error_to_json(const ValidationError& e);

// {"problem_id": ..., "valid": bool, "errors": [...]} with errors in result order.
nlohmann::json make_report(const Problem& problem, const ValidationResult& result);

// One line per error, e.g. "E1002 plan.jobs[0].pickups[0].times[0]: ..."
std::string format_error_line(const ValidationError& e);

} // namespace vrpcheck
