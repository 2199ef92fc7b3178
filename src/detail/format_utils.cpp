#include "binfill/detail/format_utils.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace binfill::detail {

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.2f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.2f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string timestamp() {
    return fmt::format("{:%H:%M:%S}", fmt::localtime(std::time(nullptr)));
}

double rateMbPerSecond(std::uint64_t bytes, double elapsed_seconds) {
    if (elapsed_seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) / (1024.0 * 1024.0) / elapsed_seconds;
}

double gbPerHour(std::uint64_t bytes, double elapsed_seconds) {
    if (elapsed_seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0) / (elapsed_seconds / 3600.0);
}

} // namespace binfill::detail
