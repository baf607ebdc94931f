#include "problem_reader.h"
#include "utils.h"

#include <limits>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace vrpcheck
{

    [[noreturn]] static void fail(const std::string &path, const std::string &msg)
    {
        throw std::runtime_error("Problem " + path + ": " + msg);
    }

    template <typename T>
    static T get_as(const json &j, const std::string &path)
    {
        try
        {
            return j.get<T>();
        }
        catch (const json::exception &e)
        {
            fail(path, e.what());
        }
    }

    static const json &require(const json &obj, const char *key, const std::string &path)
    {
        if (!obj.is_object())
            fail(path, "must be an object");
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
            fail(path + "." + key, "is required");
        return *it;
    }

    static const json *optional_field(const json &obj, const char *key)
    {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
            return nullptr;
        return &*it;
    }

    static const json &require_array(const json &j, const std::string &path)
    {
        if (!j.is_array())
            fail(path, "must be an array");
        return j;
    }

    static std::string idx(const std::string &path, std::size_t i)
    {
        return path + "[" + std::to_string(i) + "]";
    }

    // Whole numbers only, and they must fit an int: 1.5 and 4294967297 are errors.
    static int get_int(const json &j, const std::string &path)
    {
        if (!j.is_number_integer())
            fail(path, "must be an integer");
        if (j.is_number_unsigned())
        {
            if (j.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max()))
                fail(path, "is out of range");
            return static_cast<int>(j.get<unsigned long long>());
        }
        const long long v = j.get<long long>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
            fail(path, "is out of range");
        return static_cast<int>(v);
    }

    static std::vector<int> get_int_array(const json &j, const std::string &path)
    {
        require_array(j, path);
        std::vector<int> out;
        out.reserve(j.size());
        for (std::size_t i = 0; i < j.size(); ++i)
            out.push_back(get_int(j[i], idx(path, i)));
        return out;
    }

    // ---- parts ----

    static std::vector<TimeWindow> parse_times(const json &obj, const std::string &path)
    {
        std::vector<TimeWindow> out;
        const json *times = optional_field(obj, "times");
        if (!times)
            return out;
        const std::string tpath = path + ".times";
        require_array(*times, tpath);
        out.reserve(times->size());
        for (std::size_t i = 0; i < times->size(); ++i)
        {
            const json &tw = (*times)[i];
            // Arity is left to the interval checker; element type is not.
            out.push_back(get_as<TimeWindow>(require_array(tw, idx(tpath, i)), idx(tpath, i)));
        }
        return out;
    }

    static Location parse_location(const json &j, const std::string &path)
    {
        return get_as<Location>(require_array(j, path), path);
    }

    static JobTask parse_task(const json &j, const std::string &path)
    {
        if (!j.is_object())
            fail(path, "must be an object");

        JobTask t;
        if (const json *places = optional_field(j, "places"))
        {
            require_array(*places, path + ".places");
            for (std::size_t i = 0; i < places->size(); ++i)
            {
                const json &p = (*places)[i];
                const std::string ppath = idx(path + ".places", i);
                JobPlace place;
                place.location = parse_location(require(p, "location", ppath), ppath + ".location");
                if (const json *d = optional_field(p, "duration"))
                    place.duration = get_as<double>(*d, ppath + ".duration");
                t.places.push_back(std::move(place));
            }
        }
        if (const json *demand = optional_field(j, "demand"))
            t.demand = get_int_array(*demand, path + ".demand");
        t.times = parse_times(j, path);
        if (const json *tag = optional_field(j, "tag"))
            t.tag = get_as<std::string>(*tag, path + ".tag");
        return t;
    }

    static std::vector<JobTask> parse_tasks(const json &job, const char *key, const std::string &path)
    {
        std::vector<JobTask> out;
        const json *tasks = optional_field(job, key);
        if (!tasks)
            return out;
        const std::string tpath = path + "." + key;
        require_array(*tasks, tpath);
        out.reserve(tasks->size());
        for (std::size_t i = 0; i < tasks->size(); ++i)
            out.push_back(parse_task((*tasks)[i], idx(tpath, i)));
        return out;
    }

    static Job parse_job(const json &j, const std::string &path)
    {
        Job job;
        job.id = get_as<std::string>(require(j, "id", path), path + ".id");
        job.pickups = parse_tasks(j, "pickups", path);
        job.deliveries = parse_tasks(j, "deliveries", path);
        if (const json *skills = optional_field(j, "skills"))
            job.skills = get_as<std::vector<std::string>>(require_array(*skills, path + ".skills"), path + ".skills");
        return job;
    }

    static RelationType parse_relation_type(const std::string &s, const std::string &path)
    {
        if (s == "any")
            return RelationType::Any;
        if (s == "sequence")
            return RelationType::Sequence;
        if (s == "strict")
            return RelationType::Strict;
        fail(path, "unknown relation type '" + s + "' (expected any, sequence or strict)");
    }

    static Relation parse_relation(const json &j, const std::string &path)
    {
        Relation r;
        r.type = parse_relation_type(get_as<std::string>(require(j, "type", path), path + ".type"), path + ".type");
        r.jobs = get_as<std::vector<std::string>>(require_array(require(j, "jobs", path), path + ".jobs"), path + ".jobs");

        const json *vid = optional_field(j, "vehicleId");
        if (!vid)
            vid = optional_field(j, "vehicle_id");
        if (!vid)
            fail(path + ".vehicleId", "is required");
        r.vehicle_id = get_as<std::string>(*vid, path + ".vehicleId");
        return r;
    }

    static VehicleBreak parse_break(const json &j, const std::string &path)
    {
        if (!j.is_object())
            fail(path, "must be an object");
        VehicleBreak b;
        b.times = parse_times(j, path);
        if (const json *d = optional_field(j, "duration"))
            b.duration = get_as<double>(*d, path + ".duration");
        if (const json *loc = optional_field(j, "location"))
            b.location = parse_location(*loc, path + ".location");
        return b;
    }

    static VehicleShift parse_shift(const json &j, const std::string &path)
    {
        VehicleShift s;
        const json &start = require(j, "start", path);
        s.start_location = parse_location(require(start, "location", path + ".start"), path + ".start.location");
        if (const json *end = optional_field(j, "end"))
            s.end_location = parse_location(require(*end, "location", path + ".end"), path + ".end.location");
        s.times = parse_times(j, path);
        if (const json *breaks = optional_field(j, "breaks"))
        {
            require_array(*breaks, path + ".breaks");
            for (std::size_t i = 0; i < breaks->size(); ++i)
                s.breaks.push_back(parse_break((*breaks)[i], idx(path + ".breaks", i)));
        }
        return s;
    }

    static VehicleType parse_vehicle_type(const json &j, const std::string &path)
    {
        VehicleType vt;
        vt.type_id = get_as<std::string>(require(j, "id", path), path + ".id");
        if (const json *profile = optional_field(j, "profile"))
            vt.profile = get_as<std::string>(*profile, path + ".profile");

        const json *ids = optional_field(j, "vehicleIds");
        if (!ids)
            ids = optional_field(j, "vehicle_ids");
        if (!ids)
            fail(path + ".vehicleIds", "is required");
        vt.vehicle_ids = get_as<std::vector<std::string>>(require_array(*ids, path + ".vehicleIds"), path + ".vehicleIds");
        if (vt.vehicle_ids.empty())
            fail(path + ".vehicleIds", "must not be empty");

        if (const json *cap = optional_field(j, "capacity"))
            vt.capacity = get_int_array(*cap, path + ".capacity");
        vt.shift = parse_shift(require(j, "shift", path), path + ".shift");
        return vt;
    }

    // ---- entry points ----

    Problem parse_problem(const json &j)
    {
        if (!j.is_object())
            fail("document", "must be a JSON object");

        Problem p;
        if (const json *id = optional_field(j, "id"))
            p.id = get_as<std::string>(*id, "id");

        const json &plan = require(j, "plan", "document");
        const json &jobs = require_array(require(plan, "jobs", "plan"), "plan.jobs");
        p.plan.jobs.reserve(jobs.size());
        for (std::size_t i = 0; i < jobs.size(); ++i)
            p.plan.jobs.push_back(parse_job(jobs[i], idx("plan.jobs", i)));

        if (const json *relations = optional_field(plan, "relations"))
        {
            require_array(*relations, "plan.relations");
            for (std::size_t i = 0; i < relations->size(); ++i)
                p.plan.relations.push_back(parse_relation((*relations)[i], idx("plan.relations", i)));
        }

        const json &fleet = require(j, "fleet", "document");
        const json &types = require_array(require(fleet, "types", "fleet"), "fleet.types");
        p.fleet.types.reserve(types.size());
        for (std::size_t i = 0; i < types.size(); ++i)
            p.fleet.types.push_back(parse_vehicle_type(types[i], idx("fleet.types", i)));

        return p;
    }

    Problem parse_problem_text(const std::string &text)
    {
        json j;
        try
        {
            j = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            throw std::runtime_error(std::string("Problem is not valid JSON: ") + e.what());
        }
        return parse_problem(j);
    }

    Problem read_problem_file(const std::string &path)
    {
        return parse_problem(load_json(path));
    }

} // namespace vrpcheck
