#pragma once

#include <chrono>
#include <string>

namespace docmind_core {

// "YYYY-MM-DD HH:MM:SS" in UTC; the storage format for every persisted timestamp
std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

// "YYYY-MM-DDTHH:MM:SSZ", used in API responses
std::string time_point_to_iso8601(const std::chrono::system_clock::time_point& tp);

}  // namespace docmind_core
