#include "validation_error.h"

#include <utility>

namespace vrpcheck
{

    const std::vector<ErrorCode> &all_error_codes()
    {
        static const std::vector<ErrorCode> codes = {
            ErrorCode::DuplicateJobId,
            ErrorCode::DemandImbalance,
            ErrorCode::JobTimeWindow,
            ErrorCode::DuplicateVehicleType,
            ErrorCode::DuplicateVehicleId,
            ErrorCode::VehicleShiftTime,
            ErrorCode::RelationReference,
        };
        return codes;
    }

    std::string code_string(ErrorCode code)
    {
        return "E" + std::to_string(static_cast<int>(code));
    }

    std::optional<ErrorCode> parse_error_code(const std::string &s)
    {
        for (ErrorCode c : all_error_codes())
            if (code_string(c) == s)
                return c;
        return std::nullopt;
    }

    std::string action_hint(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::DuplicateJobId:
            return "Ensure that all job ids in plan.jobs are unique.";
        case ErrorCode::DemandImbalance:
            return "Make the sum of pickup demands equal the sum of delivery demands, "
                   "using the same number of dimensions for every task.";
        case ErrorCode::JobTimeWindow:
            return "Use RFC3339 timestamps, put start before end and make sure "
                   "time windows of one task do not overlap.";
        case ErrorCode::DuplicateVehicleType:
            return "Ensure that all vehicle type ids in fleet.types are unique.";
        case ErrorCode::DuplicateVehicleId:
            return "Ensure that every vehicle id is declared once across the whole fleet.";
        case ErrorCode::VehicleShiftTime:
            return "Use RFC3339 timestamps, put start before end and make sure "
                   "shift and break time windows do not overlap.";
        case ErrorCode::RelationReference:
            return "Reference only jobs defined in plan.jobs (or departure, break, arrival) "
                   "and vehicle ids declared in the fleet.";
        }
        return {};
    }

    ValidationError make_error(ErrorCode code, std::string cause,
                               std::string entity, std::string path)
    {
        return ValidationError{code, std::move(cause), action_hint(code),
                               std::move(entity), std::move(path)};
    }

    bool operator==(const ValidationError &a, const ValidationError &b)
    {
        return a.code == b.code && a.cause == b.cause && a.action == b.action &&
               a.entity == b.entity && a.path == b.path;
    }

    bool operator!=(const ValidationError &a, const ValidationError &b)
    {
        return !(a == b);
    }

} // namespace vrpcheck
