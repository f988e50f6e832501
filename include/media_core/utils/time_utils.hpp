#pragma once

#include <chrono>
#include <string>

namespace media_core {

// UTC ISO-8601, second precision: "2025-01-31T09:15:00Z"
std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);

// Inverse of time_point_to_string. Throws std::runtime_error on malformed input.
std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

}  // namespace media_core
