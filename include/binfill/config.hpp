#pragma once

#include "file_writer_task.hpp"
#include "work_planner.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace binfill {

inline constexpr std::uint64_t kKiB = 1024;
inline constexpr std::uint64_t kMiB = 1024 * kKiB;
inline constexpr std::uint64_t kGiB = 1024 * kMiB;

struct GeneratorConfig {
    std::filesystem::path output_dir{"."};
    std::uint64_t total_bytes{120 * kMiB};
    std::uint64_t min_file_size{100 * kKiB};
    std::uint64_t max_file_size{1100 * kKiB};
    std::size_t chunk_size{512 * kKiB};
    double report_interval_seconds{5.0};
    std::size_t threads{0};  // 0: min(hardware threads, 16)
    std::optional<std::uint64_t> seed;
    std::string name_prefix{"d"};
    bool assume_yes{false};

    // Throws ConfigError on the first invalid setting.
    void validate() const;

    [[nodiscard]] std::size_t effectiveThreads() const;
    [[nodiscard]] PlanOptions planOptions() const;
    [[nodiscard]] WriterOptions writerOptions() const;
};

struct CommandLine {
    GeneratorConfig config;
    bool show_help{false};
};

// Parses "1048576", "512K", "1.5M", "2GiB", ... into bytes. Suffixes are
// binary multiples; fractions are truncated.
std::uint64_t parseSize(const std::string& text);

CommandLine parseCommandLine(int argc, const char* const* argv);

void printUsage(std::ostream& out, const char* program_name);

} // namespace binfill
