#include "media_core/utils/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace media_core {

std::string time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  if (ss.fail()) {
    throw std::runtime_error("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DDTHH:MM:SSZ.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

}  // namespace media_core
