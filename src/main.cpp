// main.cpp
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "config.h"
#include "problem_reader.h"
#include "report.h"
#include "utils.h"
#include "validation.h"

using json = nlohmann::json;
using namespace vrpcheck;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string problem_path;   // required
  std::string config_path;    // optional
  std::string out_path;       // optional, overrides REPORT_OUT
  bool verbose = true;        // flipped by --quiet
};

enum ExitCode {
  kValid = 0,
  kInvalidProblem = 1,
  kUsage = 2,
  kLoadFailed = 3,
  kWriteFailed = 4,
  kEngineFailed = 5,
};

static void print_usage() {
  std::cout <<
R"(Usage:
  vrp_validate --problem problem.json [--config config.json] [--out report.json] [--quiet]

Required:
  --problem PATH      Pragmatic problem document

Optional:
  --config PATH       JSON config (PARALLEL_CHECKS, DISABLED_RULES, LOG_PROGRESS, REPORT_OUT)
  --out PATH          Write the JSON report here
  --quiet             Less logging
  --help

Exit codes: 0 valid, 1 validation errors, 2 usage, 3 load failure, 4 report write failure,
            5 validation could not run
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(kUsage); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(kValid); }
    else if (a == "--problem") f.problem_path = need("--problem");
    else if (a == "--config")  f.config_path = need("--config");
    else if (a == "--out")     f.out_path = need("--out");
    else if (a == "--quiet")   f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(kUsage); }
  }
  if (f.problem_path.empty()) {
    std::cerr << "Missing required --problem.\n"; print_usage(); std::exit(kUsage);
  }
  return f;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  Config cfg;
  Problem problem;
  try {
    if (!flags.config_path.empty()) cfg = parse_config(load_json(flags.config_path));
    problem = read_problem_file(flags.problem_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return kLoadFailed;
  }

  const bool verbose = flags.verbose && cfg.log_progress;
  if (verbose) {
    std::cout << "🔎 Validating problem '" << problem.id << "' from " << flags.problem_path << "\n";
    std::size_t vehicles = 0;
    for (const auto& vt : problem.fleet.types) vehicles += vt.vehicle_ids.size();
    std::cout << "Plan: jobs=" << problem.plan.jobs.size()
              << " relations=" << problem.plan.relations.size()
              << " | Fleet: types=" << problem.fleet.types.size()
              << " vehicles=" << vehicles
              << " | parallel=" << (cfg.parallel_checks ? "yes" : "no") << "\n";
    if (!cfg.disabled_rules.empty()) {
      std::cout << "Disabled rules:";
      for (ErrorCode c : cfg.disabled_rules) std::cout << " " << code_string(c);
      std::cout << "\n";
    }
  }

  const long long t0 = NowMillis();
  ValidationResult result;
  try {
    result = validate_all(problem, cfg);
  } catch (const std::exception& e) {
    std::cerr << "Validation failed: " << e.what() << "\n"; return kEngineFailed;
  }
  const long long t1 = NowMillis();

  for (const auto& e : result) std::cerr << format_error_line(e) << "\n";

  const std::string out_path = flags.out_path.empty() ? cfg.report_out : flags.out_path;
  if (!out_path.empty()) {
    try { save_json(out_path, make_report(problem, result)); }
    catch (const std::exception& e) { std::cerr << "Failed to write report: " << e.what() << "\n"; return kWriteFailed; }
    if (verbose) std::cout << "📝 Report written to " << out_path << "\n";
  }

  if (result.empty()) {
    if (verbose) std::cout << "✅ Problem is valid (" << (t1 - t0) << " ms)\n";
    return kValid;
  }
  if (verbose) std::cout << "❌ " << result.size() << " validation error(s) (" << (t1 - t0) << " ms)\n";
  return kInvalidProblem;
}
