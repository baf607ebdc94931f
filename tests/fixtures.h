// fixtures.h
#pragma once
#include <algorithm>
#include <string>
#include <vector>

#include "types.h"
#include "validation_error.h"

namespace fixtures {

using namespace vrpcheck;

inline TimeWindow tw(const std::string& start, const std::string& end) {
  return TimeWindow{start, end};
}

// "2020-07-04T<hhmm>:00Z"
inline std::string at(const std::string& hhmm) {
  return "2020-07-04T" + hhmm + ":00Z";
}

inline JobTask task(Demand demand, std::vector<TimeWindow> times = {}) {
  JobTask t;
  t.places.push_back(JobPlace{{52.52, 13.40}, 60.0});
  t.demand = std::move(demand);
  t.times = std::move(times);
  return t;
}

inline Job delivery_job(const std::string& id, Demand demand = {1}) {
  Job j;
  j.id = id;
  j.deliveries.push_back(task(std::move(demand)));
  return j;
}

inline Job pickup_delivery_job(const std::string& id, Demand pickup, Demand delivery) {
  Job j;
  j.id = id;
  j.pickups.push_back(task(std::move(pickup)));
  j.deliveries.push_back(task(std::move(delivery)));
  return j;
}

inline VehicleType vehicle_type(const std::string& type_id, std::vector<std::string> vehicle_ids,
                                std::vector<TimeWindow> shift_times = {tw(at("08:00"), at("20:00"))}) {
  VehicleType vt;
  vt.type_id = type_id;
  vt.profile = "car";
  vt.vehicle_ids = std::move(vehicle_ids);
  vt.capacity = {10};
  vt.shift.start_location = {52.52, 13.40};
  vt.shift.times = std::move(shift_times);
  return vt;
}

// A problem that passes every rule.
inline Problem valid_problem() {
  Problem p;
  p.id = "problem-1";
  p.plan.jobs.push_back(delivery_job("job1"));
  p.plan.jobs.push_back(pickup_delivery_job("job2", {2, 1}, {2, 1}));
  p.plan.jobs.back().pickups[0].times = {tw(at("09:00"), at("12:00"))};
  p.fleet.types.push_back(vehicle_type("car", {"car_1", "car_2"}));
  p.fleet.types.push_back(vehicle_type("truck", {"truck_1"}));
  return p;
}

inline std::size_t count_code(const ValidationResult& r, ErrorCode code) {
  return static_cast<std::size_t>(std::count_if(r.begin(), r.end(),
      [code](const ValidationError& e) { return e.code == code; }));
}

} // namespace fixtures
