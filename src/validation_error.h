// validation_error.h
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace vrpcheck {

// Stable codes; the numeric value is the number printed after 'E'.
enum class ErrorCode {
  DuplicateJobId        = 1000,
  DemandImbalance       = 1001,
  JobTimeWindow         = 1002,
  DuplicateVehicleType  = 1003,
  DuplicateVehicleId    = 1004,
  VehicleShiftTime      = 1005,
  RelationReference     = 1006,
};

// Fixed execution order of the orchestrator.
const std::vector<ErrorCode>& all_error_codes();

std::string code_string(ErrorCode code);                         // "E1002"
std::optional<ErrorCode> parse_error_code(const std::string& s); // "E1002" -> JobTimeWindow
std::string action_hint(ErrorCode code);

struct ValidationError {
  ErrorCode code;
  std::string cause;     // human-readable message
  std::string action;    // how to fix it
  std::string entity;    // job id / vehicle type id / vehicle id
  std::string path;      // e.g. "plan.jobs[2].pickups[0].times[1]"
};

using ValidationResult = std::vector<ValidationError>;

ValidationError make_error(ErrorCode code, std::string cause,
                           std::string entity, std::string path);

bool operator==(const ValidationError& a, const ValidationError& b);
bool operator!=(const ValidationError& a, const ValidationError& b);

} // namespace vrpcheck
