// types.h
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace vrpcheck {

// ---- Data model ----

// Raw ["start", "end"] pair exactly as written in the problem document.
// Kept as text so an unparseable timestamp is a finding, not a read failure.
using TimeWindow = std::vector<std::string>;

// One quantity per resource dimension (weight, volume, ...).
using Demand = std::vector<int>;

// [lat, lng]
using Location = std::vector<double>;

struct JobPlace {
  Location location;
  double duration = 0.0;    // service time, seconds
};

struct JobTask {
  std::vector<JobPlace> places;
  Demand demand;
  std::vector<TimeWindow> times;
  std::optional<std::string> tag;
};

struct Job {
  std::string id;
  std::vector<JobTask> pickups;
  std::vector<JobTask> deliveries;
  std::optional<std::vector<std::string>> skills;
};

enum class RelationType { Any, Sequence, Strict };

struct Relation {
  RelationType type = RelationType::Any;
  std::vector<std::string> jobs;    // job ids or reserved activity names
  std::string vehicle_id;
};

struct Plan {
  std::vector<Job> jobs;
  std::vector<Relation> relations;
};

struct VehicleBreak {
  std::vector<TimeWindow> times;
  double duration = 0.0;            // seconds
  std::optional<Location> location;
};

struct VehicleShift {
  Location start_location;
  std::optional<Location> end_location;
  std::vector<TimeWindow> times;
  std::vector<VehicleBreak> breaks;
};

struct VehicleType {
  std::string type_id;
  std::string profile;
  std::vector<std::string> vehicle_ids;
  std::vector<int> capacity;
  VehicleShift shift;
};

struct Fleet {
  std::vector<VehicleType> types;
};

struct Problem {
  std::string id;
  Plan plan;
  Fleet fleet;
};

} // namespace vrpcheck
