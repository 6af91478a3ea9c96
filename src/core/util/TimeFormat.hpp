#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace frl {

// "2024-05-01T12:00:00Z"
std::string utc_iso8601(std::time_t t);
std::string utc_iso8601_now();

// Local wall clock, "yyyy-mm-dd HH:MM:SS".
std::string local_timestamp(std::time_t t);

// Seconds as "H:MM:SS", fractions rounded up like every displayed duration.
std::string clock_duration(double seconds);

// 1536 -> "1.5 KB"
std::string human_bytes(std::uint64_t bytes);

} // namespace frl
