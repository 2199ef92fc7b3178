#include "binfill/config.hpp"
#include "binfill/error.hpp"
#include "binfill/worker_pool.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <ostream>
#include <string>

#include <fmt/format.h>

namespace binfill {

namespace {

constexpr std::size_t kMaxThreads = 256;

std::uint64_t suffixMultiplier(std::string suffix, const std::string& text) {
    for (auto& c : suffix) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (suffix.empty() || suffix == "B") {
        return 1;
    }

    // K, KB, KIB and so on
    std::uint64_t multiplier = 0;
    switch (suffix.front()) {
    case 'K': multiplier = kKiB; break;
    case 'M': multiplier = kMiB; break;
    case 'G': multiplier = kGiB; break;
    case 'T': multiplier = 1024 * kGiB; break;
    default: break;
    }
    const std::string rest = suffix.substr(1);
    if (multiplier == 0 || !(rest.empty() || rest == "B" || rest == "IB")) {
        throw ConfigError("Invalid size unit: " + text);
    }
    return multiplier;
}

const char* requireValue(int argc, const char* const* argv, int index) {
    if (index + 1 >= argc) {
        throw ConfigError(fmt::format("Option {} requires a value", argv[index]));
    }
    return argv[index + 1];
}

} // namespace

std::uint64_t parseSize(const std::string& text) {
    std::size_t split = 0;
    while (split < text.size()
           && (std::isdigit(static_cast<unsigned char>(text[split])) || text[split] == '.')) {
        ++split;
    }
    if (split == 0) {
        throw ConfigError("Invalid size: " + text);
    }

    long double value = 0;
    try {
        std::size_t used = 0;
        value = std::stold(text.substr(0, split), &used);
        if (used != split) {
            throw ConfigError("Invalid size: " + text);
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception&) {
        throw ConfigError("Invalid size: " + text);
    }

    const long double bytes = std::floor(value * static_cast<long double>(suffixMultiplier(text.substr(split), text)));
    if (bytes >= static_cast<long double>(std::numeric_limits<std::uint64_t>::max())) {
        throw ConfigError("Size out of range: " + text);
    }
    return static_cast<std::uint64_t>(bytes);
}

void GeneratorConfig::validate() const {
    if (total_bytes == 0) {
        throw ConfigError("Total size must be greater than zero");
    }
    if (min_file_size == 0) {
        throw ConfigError("Minimum file size must be greater than zero");
    }
    if (max_file_size < min_file_size) {
        throw ConfigError(fmt::format("Maximum file size ({}) is smaller than minimum file size ({})",
                                      max_file_size, min_file_size));
    }
    if (chunk_size == 0) {
        throw ConfigError("Chunk size must be greater than zero");
    }
    if (!(report_interval_seconds >= 0.0) || !std::isfinite(report_interval_seconds)) {
        throw ConfigError("Report interval must be a non-negative number of seconds");
    }
    if (threads > kMaxThreads) {
        throw ConfigError(fmt::format("Thread count must be between 1 and {}", kMaxThreads));
    }
    if (name_prefix.empty() || name_prefix.find('/') != std::string::npos) {
        throw ConfigError("File name prefix must be non-empty and must not contain '/'");
    }
    if (output_dir.empty()) {
        throw ConfigError("Output directory must not be empty");
    }
}

std::size_t GeneratorConfig::effectiveThreads() const {
    return threads > 0 ? threads : WorkerPool::defaultConcurrency();
}

PlanOptions GeneratorConfig::planOptions() const {
    PlanOptions options;
    options.total_bytes = total_bytes;
    options.min_item_size = min_file_size;
    options.max_item_size = max_file_size;
    options.seed = seed;
    options.name_prefix = name_prefix;
    return options;
}

WriterOptions GeneratorConfig::writerOptions() const {
    WriterOptions options;
    options.chunk_size = chunk_size;
    options.report_interval = std::chrono::duration<double>(report_interval_seconds);
    return options;
}

CommandLine parseCommandLine(int argc, const char* const* argv) {
    CommandLine command_line;
    GeneratorConfig& config = command_line.config;

    int arg_index = 1;
    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            command_line.show_help = true;
            return command_line;
        } else if (option == "-y") {
            config.assume_yes = true;
            arg_index += 1;
            continue;
        }

        const std::string value = requireValue(argc, argv, arg_index);
        if (option == "-d") {
            config.output_dir = value;
        } else if (option == "-n") {
            config.total_bytes = parseSize(value);
        } else if (option == "-m") {
            config.min_file_size = parseSize(value);
        } else if (option == "-M") {
            config.max_file_size = parseSize(value);
        } else if (option == "-c") {
            const std::uint64_t chunk = parseSize(value);
            if (chunk > std::numeric_limits<std::size_t>::max()) {
                throw ConfigError("Chunk size out of range: " + value);
            }
            config.chunk_size = static_cast<std::size_t>(chunk);
        } else if (option == "-i") {
            try {
                std::size_t used = 0;
                config.report_interval_seconds = std::stod(value, &used);
                if (used != value.size()) {
                    throw ConfigError("Invalid report interval: " + value);
                }
            } catch (const ConfigError&) {
                throw;
            } catch (const std::exception&) {
                throw ConfigError("Invalid report interval: " + value);
            }
        } else if (option == "-t") {
            int threads = 0;
            try {
                std::size_t used = 0;
                threads = std::stoi(value, &used);
                if (used != value.size()) {
                    throw ConfigError("Invalid thread count: " + value);
                }
            } catch (const ConfigError&) {
                throw;
            } catch (const std::exception&) {
                throw ConfigError("Invalid thread count: " + value);
            }
            if (threads <= 0 || static_cast<std::size_t>(threads) > kMaxThreads) {
                throw ConfigError(fmt::format("Thread count must be between 1 and {}", kMaxThreads));
            }
            config.threads = static_cast<std::size_t>(threads);
        } else if (option == "-r") {
            try {
                std::size_t used = 0;
                const unsigned long long seed = std::stoull(value, &used);
                if (used != value.size() || value.front() == '-') {
                    throw ConfigError("Invalid seed: " + value);
                }
                config.seed = static_cast<std::uint64_t>(seed);
            } catch (const ConfigError&) {
                throw;
            } catch (const std::exception&) {
                throw ConfigError("Invalid seed: " + value);
            }
        } else if (option == "-p") {
            config.name_prefix = value;
        } else {
            throw ConfigError("Unknown option: " + option);
        }
        arg_index += 2;
    }

    config.validate();
    return command_line;
}

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name
        << " [-d <directory>] [-n <total>] [-m <min>] [-M <max>] [-c <chunk>] [-i <seconds>]"
           " [-t <threads>] [-r <seed>] [-p <prefix>] [-y]\n";
    out << "Options:\n"
        << "  -d <directory>   Output directory (default: current directory)\n"
        << "  -n <size>        Total size to generate (default: 120M)\n"
        << "  -m <size>        Minimum file size (default: 100K)\n"
        << "  -M <size>        Maximum file size (default: 1100K)\n"
        << "  -c <size>        Write chunk size (default: 512K)\n"
        << "  -i <seconds>     Progress report interval per file (default: 5)\n"
        << "  -t <threads>     Number of writer threads (default: min(cores, 16))\n"
        << "  -r <seed>        Seed for the file size plan\n"
        << "  -p <prefix>      File name prefix (default: d)\n"
        << "  -y               Do not ask for confirmation when disk space is short\n"
        << "  -h, --help       Show this message\n"
        << "Sizes accept K, M, G and T suffixes (powers of 1024)." << std::endl;
}

} // namespace binfill
