#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace facewatch {

std::string json_escape(const std::string& s);

// 2024-01-31T12:00:00Z
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

// 20240131_120000, local time, used in capture file names
std::string compact_local_timestamp(std::chrono::system_clock::time_point tp);

std::string make_event_id();

// RFC 4648 base64 with padding.
std::string base64_encode(const std::vector<uint8_t>& bytes);

}  // namespace facewatch
