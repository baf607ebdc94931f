#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace vrpcheck {

// Returns current time in milliseconds (steady clock)
inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// ---------- JSON file helpers ----------
inline nlohmann::json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  nlohmann::json j;
  try { in >> j; }
  catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
  }
  return j;
}

inline void save_json(const std::string& path, const nlohmann::json& j) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

} // namespace vrpcheck
