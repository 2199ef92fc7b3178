#include "binfill/disk_space.hpp"
#include "binfill/detail/format_utils.hpp"

#include <string>
#include <system_error>

#include <fmt/format.h>

namespace binfill {

std::uint64_t availableBytes(const std::filesystem::path& path) {
    return static_cast<std::uint64_t>(std::filesystem::space(path).available);
}

std::filesystem::path existingAncestor(const std::filesystem::path& path) {
    std::filesystem::path current = std::filesystem::absolute(path);
    std::error_code ec;
    while (!std::filesystem::exists(current, ec)) {
        if (!current.has_relative_path()) {
            break;
        }
        current = current.parent_path();
    }
    return current;
}

bool confirmDiskSpace(std::uint64_t required, std::uint64_t available, std::istream& in, std::ostream& out) {
    if (available >= required) {
        return true;
    }

    out << "Warning: not enough disk space!\n";
    out << fmt::format("Required:  {}\n", detail::formatSize(required));
    out << fmt::format("Available: {}\n", detail::formatSize(available));
    out << "Continue? (y/n): " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        return false;
    }
    const auto first = answer.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return false;
    }
    const auto last = answer.find_last_not_of(" \t\r");
    const std::string trimmed = answer.substr(first, last - first + 1);
    return trimmed == "y" || trimmed == "Y";
}

} // namespace binfill
