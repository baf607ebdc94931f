#include "config.h"

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace vrpcheck
{

    bool Config::is_enabled(ErrorCode code) const
    {
        return std::find(disabled_rules.begin(), disabled_rules.end(), code) == disabled_rules.end();
    }

    Config parse_config(const json &j)
    {
        if (j.is_null())
            return Config{};
        if (!j.is_object())
            throw std::runtime_error("Config must be a JSON object.");

        Config cfg;
        try
        {
            cfg.parallel_checks = j.value("PARALLEL_CHECKS", false);
            cfg.log_progress = j.value("LOG_PROGRESS", true);
            cfg.report_out = j.value("REPORT_OUT", std::string{});
        }
        catch (const json::exception &e)
        {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }

        if (j.contains("DISABLED_RULES"))
        {
            const auto &rules = j["DISABLED_RULES"];
            if (!rules.is_array())
                throw std::runtime_error("Config DISABLED_RULES must be an array of rule codes.");
            for (const auto &r : rules)
            {
                if (!r.is_string())
                    throw std::runtime_error("Config DISABLED_RULES entries must be strings.");
                const auto code = parse_error_code(r.get<std::string>());
                if (!code)
                    throw std::runtime_error("Unknown rule code in DISABLED_RULES: " + r.get<std::string>());
                if (cfg.is_enabled(*code))
                    cfg.disabled_rules.push_back(*code);
            }
        }
        return cfg;
    }

} // namespace vrpcheck
