#include "report.h"

using json = nlohmann::json;

namespace vrpcheck
{

    json error_to_json(const ValidationError &e)
    {
        return {{"code", code_string(e.code)},
                {"cause", e.cause},
                {"action", e.action},
                {"entity", e.entity},
                {"path", e.path}};
    }

    json make_report(const Problem &problem, const ValidationResult &result)
    {
        json errors = json::array();
        for (const auto &e : result)
            errors.push_back(error_to_json(e));

        return {{"problem_id", problem.id},
                {"valid", result.empty()},
                {"errors", errors}};
    }

    std::string format_error_line(const ValidationError &e)
    {
        return code_string(e.code) + " " + e.path + ": " + e.cause;
    }

} // namespace vrpcheck
