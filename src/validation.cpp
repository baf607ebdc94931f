#include "validation.h"
#include "problem_reader.h"
#include "time_window.h"

#include <algorithm>
#include <future>
#include <iterator>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace vrpcheck
{

    // ---- helpers ----

    struct DuplicateGroup
    {
        std::string id;
        std::vector<std::size_t> positions; // every occurrence, ascending
    };

    // One linear pass; groups come back in order of first occurrence.
    static std::vector<DuplicateGroup> find_duplicates(const std::vector<std::string> &ids)
    {
        std::unordered_map<std::string, std::size_t> group_of;
        std::vector<DuplicateGroup> groups;
        group_of.reserve(ids.size() * 2);

        for (std::size_t i = 0; i < ids.size(); ++i)
        {
            auto it = group_of.find(ids[i]);
            if (it == group_of.end())
            {
                group_of.emplace(ids[i], groups.size());
                groups.push_back(DuplicateGroup{ids[i], {i}});
            }
            else
            {
                groups[it->second].positions.push_back(i);
            }
        }

        std::vector<DuplicateGroup> out;
        for (auto &g : groups)
            if (g.positions.size() > 1)
                out.push_back(std::move(g));
        return out;
    }

    static std::string join_quoted(const std::vector<std::string> &items)
    {
        std::ostringstream o;
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (i)
                o << ", ";
            o << "'" << items[i] << "'";
        }
        return o.str();
    }

    template <typename T>
    static std::string format_vector(const std::vector<T> &v)
    {
        std::ostringstream o;
        o << "[";
        for (std::size_t i = 0; i < v.size(); ++i)
        {
            if (i)
                o << ", ";
            o << v[i];
        }
        o << "]";
        return o.str();
    }

    static std::string job_path(std::size_t job_idx)
    {
        return "plan.jobs[" + std::to_string(job_idx) + "]";
    }

    static std::string type_path(std::size_t type_idx)
    {
        return "fleet.types[" + std::to_string(type_idx) + "]";
    }

    // Turns interval issues for one window list into errors. Per-window issues
    // point at the window, overlaps at the list.
    static void append_window_errors(ValidationResult &out,
                                     ErrorCode code,
                                     const std::vector<TimeWindow> &times,
                                     const std::string &entity,
                                     const std::string &owner,
                                     const std::string &times_path)
    {
        for (const auto &issue : check_time_windows(times))
        {
            const std::string path = issue.kind == IntervalIssueKind::Overlap
                                         ? times_path
                                         : times_path + "[" + std::to_string(issue.index) + "]";
            out.push_back(make_error(code, owner + ": " + describe_issue(issue, times), entity, path));
        }
    }

    // ---- E1000 ----

    ValidationResult check_duplicate_job_ids(const Plan &plan)
    {
        std::vector<std::string> ids;
        ids.reserve(plan.jobs.size());
        for (const auto &j : plan.jobs)
            ids.push_back(j.id);

        ValidationResult out;
        for (const auto &g : find_duplicates(ids))
        {
            std::vector<std::string> where;
            for (std::size_t p : g.positions)
                where.push_back(job_path(p));

            std::ostringstream oss;
            oss << "Duplicate job id '" << g.id << "' used " << g.positions.size() << " times at ";
            for (std::size_t i = 0; i < where.size(); ++i)
                oss << (i ? ", " : "") << where[i];
            out.push_back(make_error(ErrorCode::DuplicateJobId, oss.str(), g.id, where[1]));
        }
        return out;
    }

    // ---- E1001 ----

    ValidationResult check_demand_balance(const Plan &plan)
    {
        ValidationResult out;

        for (std::size_t j = 0; j < plan.jobs.size(); ++j)
        {
            const Job &job = plan.jobs[j];
            if (job.pickups.empty() || job.deliveries.empty())
                continue;

            std::vector<std::size_t> pickup_dims, delivery_dims;
            for (const auto &t : job.pickups)
                pickup_dims.push_back(t.demand.size());
            for (const auto &t : job.deliveries)
                delivery_dims.push_back(t.demand.size());

            const std::size_t dims = pickup_dims.front();
            const auto same_dims = [dims](std::size_t d)
            { return d == dims; };
            if (!std::all_of(pickup_dims.begin(), pickup_dims.end(), same_dims) ||
                !std::all_of(delivery_dims.begin(), delivery_dims.end(), same_dims))
            {
                out.push_back(make_error(ErrorCode::DemandImbalance,
                                         "Job '" + job.id + "' has inconsistent demand dimensions: pickups " +
                                             format_vector(pickup_dims) + ", deliveries " + format_vector(delivery_dims),
                                         job.id, job_path(j)));
                continue;
            }

            std::vector<long long> pickup_total(dims, 0), delivery_total(dims, 0);
            for (const auto &t : job.pickups)
                for (std::size_t d = 0; d < dims; ++d)
                    pickup_total[d] += t.demand[d];
            for (const auto &t : job.deliveries)
                for (std::size_t d = 0; d < dims; ++d)
                    delivery_total[d] += t.demand[d];

            if (pickup_total != delivery_total)
            {
                out.push_back(make_error(ErrorCode::DemandImbalance,
                                         "Job '" + job.id + "' pickup demand total " + format_vector(pickup_total) +
                                             " does not match delivery demand total " + format_vector(delivery_total),
                                         job.id, job_path(j)));
            }
        }
        return out;
    }

    // ---- E1002 ----

    ValidationResult check_job_time_windows(const Plan &plan)
    {
        ValidationResult out;

        for (std::size_t j = 0; j < plan.jobs.size(); ++j)
        {
            const Job &job = plan.jobs[j];
            const auto visit = [&](const std::vector<JobTask> &tasks, const char *role)
            {
                for (std::size_t t = 0; t < tasks.size(); ++t)
                {
                    const std::string task = std::string(role) + "[" + std::to_string(t) + "]";
                    append_window_errors(out, ErrorCode::JobTimeWindow, tasks[t].times, job.id,
                                         "Job '" + job.id + "' " + task,
                                         job_path(j) + "." + task + ".times");
                }
            };
            visit(job.pickups, "pickups");
            visit(job.deliveries, "deliveries");
        }
        return out;
    }

    // ---- E1003 ----

    ValidationResult check_duplicate_vehicle_types(const Fleet &fleet)
    {
        std::vector<std::string> ids;
        ids.reserve(fleet.types.size());
        for (const auto &t : fleet.types)
            ids.push_back(t.type_id);

        ValidationResult out;
        for (const auto &g : find_duplicates(ids))
        {
            std::ostringstream oss;
            oss << "Duplicate vehicle type id '" << g.id << "' declared by ";
            for (std::size_t i = 0; i < g.positions.size(); ++i)
                oss << (i ? ", " : "") << type_path(g.positions[i]);
            out.push_back(make_error(ErrorCode::DuplicateVehicleType, oss.str(), g.id,
                                     type_path(g.positions[1])));
        }
        return out;
    }

    // ---- E1004 ----

    ValidationResult check_duplicate_vehicle_ids(const Fleet &fleet)
    {
        // Uniqueness spans the fleet, so flatten first.
        struct VehicleRef
        {
            std::size_t type_idx;
            std::size_t id_idx;
        };
        std::vector<std::string> ids;
        std::vector<VehicleRef> refs;
        for (std::size_t t = 0; t < fleet.types.size(); ++t)
        {
            const auto &vt = fleet.types[t];
            for (std::size_t v = 0; v < vt.vehicle_ids.size(); ++v)
            {
                ids.push_back(vt.vehicle_ids[v]);
                refs.push_back(VehicleRef{t, v});
            }
        }

        ValidationResult out;
        for (const auto &g : find_duplicates(ids))
        {
            std::vector<std::string> type_ids;
            std::unordered_set<std::size_t> seen_types;
            for (std::size_t p : g.positions)
                if (seen_types.insert(refs[p].type_idx).second)
                    type_ids.push_back(fleet.types[refs[p].type_idx].type_id);

            std::ostringstream oss;
            oss << "Duplicate vehicle id '" << g.id << "' ";
            if (type_ids.size() == 1)
                oss << "declared " << g.positions.size() << " times in vehicle type " << join_quoted(type_ids);
            else
                oss << "declared in vehicle types " << join_quoted(type_ids);

            const VehicleRef &second = refs[g.positions[1]];
            out.push_back(make_error(ErrorCode::DuplicateVehicleId, oss.str(), g.id,
                                     type_path(second.type_idx) + ".vehicleIds[" + std::to_string(second.id_idx) + "]"));
        }
        return out;
    }

    // ---- E1005 ----

    ValidationResult check_vehicle_shift_times(const Fleet &fleet)
    {
        ValidationResult out;

        for (std::size_t t = 0; t < fleet.types.size(); ++t)
        {
            const VehicleType &vt = fleet.types[t];
            const std::string shift_path = type_path(t) + ".shift";
            append_window_errors(out, ErrorCode::VehicleShiftTime, vt.shift.times, vt.type_id,
                                 "Vehicle type '" + vt.type_id + "' shift", shift_path + ".times");

            for (std::size_t b = 0; b < vt.shift.breaks.size(); ++b)
            {
                const std::string brk = "breaks[" + std::to_string(b) + "]";
                append_window_errors(out, ErrorCode::VehicleShiftTime, vt.shift.breaks[b].times, vt.type_id,
                                     "Vehicle type '" + vt.type_id + "' shift " + brk,
                                     shift_path + "." + brk + ".times");
            }
        }
        return out;
    }

    // ---- E1006 ----

    ValidationResult check_relation_references(const Problem &problem)
    {
        static const std::unordered_set<std::string> reserved = {"departure", "break", "arrival"};

        std::unordered_set<std::string> job_ids;
        for (const auto &j : problem.plan.jobs)
            job_ids.insert(j.id);
        std::unordered_set<std::string> vehicle_ids;
        for (const auto &vt : problem.fleet.types)
            vehicle_ids.insert(vt.vehicle_ids.begin(), vt.vehicle_ids.end());

        ValidationResult out;
        const auto &relations = problem.plan.relations;
        for (std::size_t r = 0; r < relations.size(); ++r)
        {
            const Relation &rel = relations[r];

            std::vector<std::string> unknown_jobs;
            for (const auto &id : rel.jobs)
                if (!job_ids.count(id) && !reserved.count(id))
                    unknown_jobs.push_back(id);
            const bool unknown_vehicle = !vehicle_ids.count(rel.vehicle_id);

            if (unknown_jobs.empty() && !unknown_vehicle)
                continue;

            std::ostringstream oss;
            oss << "Relation " << r << " references";
            if (!unknown_jobs.empty())
                oss << " unknown job id(s) " << join_quoted(unknown_jobs);
            if (!unknown_jobs.empty() && unknown_vehicle)
                oss << " and";
            if (unknown_vehicle)
                oss << " unknown vehicle id '" << rel.vehicle_id << "'";

            // entity is the first unresolved reference
            const std::string &entity = unknown_jobs.empty() ? rel.vehicle_id : unknown_jobs.front();
            out.push_back(make_error(ErrorCode::RelationReference, oss.str(), entity,
                                     "plan.relations[" + std::to_string(r) + "]"));
        }
        return out;
    }

    // ---- orchestration ----

    ValidationResult run_rule(ErrorCode code, const Problem &problem)
    {
        switch (code)
        {
        case ErrorCode::DuplicateJobId:
            return check_duplicate_job_ids(problem.plan);
        case ErrorCode::DemandImbalance:
            return check_demand_balance(problem.plan);
        case ErrorCode::JobTimeWindow:
            return check_job_time_windows(problem.plan);
        case ErrorCode::DuplicateVehicleType:
            return check_duplicate_vehicle_types(problem.fleet);
        case ErrorCode::DuplicateVehicleId:
            return check_duplicate_vehicle_ids(problem.fleet);
        case ErrorCode::VehicleShiftTime:
            return check_vehicle_shift_times(problem.fleet);
        case ErrorCode::RelationReference:
            return check_relation_references(problem);
        }
        return {};
    }

    ValidationResult validate_all(const Problem &problem, const Config &config)
    {
        std::vector<ErrorCode> rules;
        for (ErrorCode code : all_error_codes())
            if (config.is_enabled(code))
                rules.push_back(code);

        std::vector<ValidationResult> partial(rules.size());

        if (config.parallel_checks)
        {
            // Each rule fills its own buffer; joining in rule order keeps the
            // merged output identical to the sequential path.
            // A rule whose thread cannot be started runs inline instead.
            std::vector<std::future<ValidationResult>> pool(rules.size());
            for (std::size_t i = 0; i < rules.size(); ++i)
            {
                const ErrorCode code = rules[i];
                try
                {
                    pool[i] = std::async(std::launch::async, [code, &problem]()
                                         { return run_rule(code, problem); });
                }
                catch (const std::system_error &)
                {
                    partial[i] = run_rule(code, problem);
                }
            }
            for (std::size_t i = 0; i < pool.size(); ++i)
                if (pool[i].valid())
                    partial[i] = pool[i].get();
        }
        else
        {
            for (std::size_t i = 0; i < rules.size(); ++i)
                partial[i] = run_rule(rules[i], problem);
        }

        ValidationResult all;
        for (auto &p : partial)
            all.insert(all.end(), std::make_move_iterator(p.begin()), std::make_move_iterator(p.end()));
        return all;
    }

    ValidationResult validate_all(const nlohmann::json &problem_json, const Config &config)
    {
        const Problem problem = parse_problem(problem_json);
        return validate_all(problem, config);
    }

} // namespace vrpcheck
