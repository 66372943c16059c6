#include "docmind_core/utils/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace docmind_core {

namespace {

std::string format_utc(const std::chrono::system_clock::time_point& tp, const char* format) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct{};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, format);
  return ss.str();
}

}  // namespace

std::string time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  return format_utc(tp, "%Y-%m-%d %H:%M:%S");
}

std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw std::runtime_error("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // We stored GMT time.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

std::string time_point_to_iso8601(const std::chrono::system_clock::time_point& tp) {
  return format_utc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

}  // namespace docmind_core
