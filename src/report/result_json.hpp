#pragma once
#include <ostream>
#include <string>

#include "result.hpp"

namespace lhm {
// Serializes the payload. Failed rounds are written as -1 and unpopulated
// heatmap cells as 0.
void write_result_json(std::ostream& out, const RunResult& r);
std::string result_to_json(const RunResult& r);

// Writes to path; false (and an ERROR log) if the file cannot be written.
bool write_result_file(const std::string& path, const RunResult& r);

std::string json_escape(const std::string& s);
std::string format_number(double v);
}  // namespace lhm
