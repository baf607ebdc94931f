#include <catch2/catch.hpp>

#include "fixtures.h"
#include "validation.h"

using namespace vrpcheck;
using namespace fixtures;

TEST_CASE("End before start yields exactly one E1002", "[rules][E1002]")
{
    Plan plan;
    Job job = delivery_job("job1");
    job.deliveries[0].times = {tw("2020-07-04T12:00:00Z", "2020-07-04T11:00:00Z")};
    plan.jobs.push_back(job);

    const auto errors = check_job_time_windows(plan);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].code == ErrorCode::JobTimeWindow);
    REQUIRE(errors[0].entity == "job1");
    REQUIRE(errors[0].path == "plan.jobs[0].deliveries[0].times[0]");
    REQUIRE(errors[0].cause.find("Job 'job1' deliveries[0]") != std::string::npos);
}

TEST_CASE("Job time window findings carry role and task index", "[rules][E1002]")
{
    Plan plan;
    plan.jobs.push_back(delivery_job("fine"));
    Job job;
    job.id = "multi";
    job.pickups = {task({1}), task({1}, {tw(at("10:00"), at("14:00")), tw(at("13:00"), at("17:00"))})};
    job.deliveries = {task({2}, {tw("noon", at("13:00"))})};
    plan.jobs.push_back(job);

    const auto errors = check_job_time_windows(plan);
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].entity == "multi");
    REQUIRE(errors[0].path == "plan.jobs[1].pickups[1].times");
    REQUIRE(errors[0].cause.find("overlap") != std::string::npos);
    REQUIRE(errors[1].path == "plan.jobs[1].deliveries[0].times[0]");
    REQUIRE(errors[1].cause.find("noon") != std::string::npos);
}

TEST_CASE("Touching job windows and tasks without windows pass", "[rules][E1002]")
{
    Plan plan;
    Job job = delivery_job("job1");
    job.deliveries[0].times = {tw(at("10:00"), at("12:00")), tw(at("12:00"), at("14:00"))};
    plan.jobs.push_back(job);
    plan.jobs.push_back(delivery_job("job2"));

    REQUIRE(check_job_time_windows(plan).empty());
}

TEST_CASE("Windows of different tasks are never compared", "[rules][E1002]")
{
    Plan plan;
    Job job;
    job.id = "job1";
    job.pickups = {task({1}, {tw(at("10:00"), at("14:00"))})};
    job.deliveries = {task({1}, {tw(at("10:00"), at("14:00"))})};
    plan.jobs.push_back(job);

    REQUIRE(check_job_time_windows(plan).empty());
}

TEST_CASE("Shift windows are checked like job windows", "[rules][E1005]")
{
    Fleet fleet;
    fleet.types = {
        vehicle_type("ok", {"v1"}, {tw(at("06:00"), at("10:00")), tw(at("10:00"), at("18:00"))}),
        vehicle_type("inverted", {"v2"}, {tw("2020-07-04T12:00:00Z", "2020-07-04T11:00:00Z")}),
        vehicle_type("overlap", {"v3"}, {tw(at("10:00"), at("14:00")), tw(at("13:00"), at("17:00"))}),
    };

    const auto errors = check_vehicle_shift_times(fleet);
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].code == ErrorCode::VehicleShiftTime);
    REQUIRE(errors[0].entity == "inverted");
    REQUIRE(errors[0].path == "fleet.types[1].shift.times[0]");
    REQUIRE(errors[1].entity == "overlap");
    REQUIRE(errors[1].path == "fleet.types[2].shift.times");
}

TEST_CASE("Shift and job windows share one definition of validity", "[rules][E1002][E1005]")
{
    const std::vector<TimeWindow> windows = {
        tw(at("10:00"), at("14:00")),
        tw(at("13:00"), at("17:00")),
        tw("bad", at("18:00")),
        tw(at("19:00"), at("18:30")),
    };

    Plan plan;
    Job job = delivery_job("job");
    job.deliveries[0].times = windows;
    plan.jobs.push_back(job);

    Fleet fleet;
    fleet.types = {vehicle_type("type", {"v"}, windows)};

    const auto job_errors = check_job_time_windows(plan);
    const auto shift_errors = check_vehicle_shift_times(fleet);
    REQUIRE(job_errors.size() == 3);
    REQUIRE(shift_errors.size() == job_errors.size());
}

TEST_CASE("Break windows are reported under E1005", "[rules][E1005]")
{
    Fleet fleet;
    VehicleType vt = vehicle_type("car", {"v1"});
    VehicleBreak ok;
    ok.times = {tw(at("12:00"), at("13:00"))};
    ok.duration = 1800;
    VehicleBreak bad;
    bad.times = {tw(at("15:00"), at("14:00"))};
    bad.duration = 1800;
    vt.shift.breaks = {ok, bad};
    fleet.types.push_back(vt);

    const auto errors = check_vehicle_shift_times(fleet);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].code == ErrorCode::VehicleShiftTime);
    REQUIRE(errors[0].path == "fleet.types[0].shift.breaks[1].times[0]");
}
