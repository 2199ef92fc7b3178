#pragma once

#include <cstdint>
#include <string>

namespace binfill::detail {

// "512 B", "1.5 KB", "12.0 MB", "3.2 GB"
std::string formatSize(std::uint64_t bytes);

// Local wall-clock time as HH:MM:SS.
std::string timestamp();

// Bytes per second expressed in MB/s; 0 when no time has elapsed.
double rateMbPerSecond(std::uint64_t bytes, double elapsed_seconds);

// Bytes per elapsed hour expressed in GB/h; 0 when no time has elapsed.
double gbPerHour(std::uint64_t bytes, double elapsed_seconds);

} // namespace binfill::detail
