// problem_reader.h
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"

namespace vrpcheck {

// Maps a pragmatic problem document onto the typed model.
//
// Timestamps are copied as text; whether they parse is decided by the
// time-window rules. Anything the model cannot hold (missing plan, job
// without id, non-integer demand, ...) throws std::runtime_error naming the
// JSON path.
Problem parse_problem(const nlohmann::json& j);

// Same, from JSON text. Syntax errors are reported as std::runtime_error too.
Problem parse_problem_text(const std::string& text);

Problem read_problem_file(const std::string& path);

} // namespace vrpcheck
