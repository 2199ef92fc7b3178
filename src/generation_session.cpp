#include "binfill/generation_session.hpp"
#include "binfill/detail/format_utils.hpp"
#include "binfill/disk_space.hpp"
#include "binfill/event_channel.hpp"
#include "binfill/work_planner.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace binfill {

GenerationSession::GenerationSession(GeneratorConfig config, std::ostream& out, std::istream& in,
                                     ByteSourceFactory source_factory)
    : config_(std::move(config)), out_(out), in_(in), source_factory_(std::move(source_factory)) {}

std::optional<SessionResult> GenerationSession::run() {
    config_.validate();

    out_ << fmt::format("Target total size: {}\n", detail::formatSize(config_.total_bytes));
    out_ << fmt::format("File size range:   {} to {}\n", detail::formatSize(config_.min_file_size),
                        detail::formatSize(config_.max_file_size));

    if (!preflight()) {
        out_ << "Operation cancelled" << std::endl;
        return std::nullopt;
    }
    prepareOutputDirectory();

    SessionResult result;
    WorkPlanner planner(config_.planOptions());
    result.plan = planner.plan();

    WorkerPool pool(config_.effectiveThreads(), config_.output_dir, config_.writerOptions(), source_factory_);
    out_ << fmt::format("Planned {} files, {} in total\n", result.plan.size(),
                        detail::formatSize(config_.total_bytes));
    out_ << fmt::format("Writing with {} threads into {}\n", pool.slotCount(result.plan.size()),
                        config_.output_dir.string());

    EventChannel channel;
    std::exception_ptr pool_error;

    std::thread pool_thread([&]() {
        try {
            result.pool = pool.run(result.plan, channel);
        } catch (const std::exception&) {
            pool_error = std::current_exception();
        }
        channel.close();
    });

    try {
        ProgressAggregator aggregator(channel, result.plan.size(), config_.total_bytes, out_);
        result.tally = aggregator.run();
    } catch (...) {
        // Writers run to completion on their own; wait for them before unwinding.
        pool_thread.join();
        throw;
    }

    pool_thread.join();
    if (pool_error) {
        std::rethrow_exception(pool_error);
    }
    return result;
}

void GenerationSession::prepareOutputDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory: "
            + config_.output_dir.string() + " - " + ec.message());
    }
}

bool GenerationSession::preflight() {
    std::uint64_t available = 0;
    try {
        // The output directory may not exist yet; it is only created once the run is confirmed.
        available = availableBytes(existingAncestor(config_.output_dir));
    } catch (const std::filesystem::filesystem_error& ex) {
        fmt::print(stderr, "warning: cannot check disk space: {}\n", ex.what());
        fmt::print(stderr, "continuing, make sure there is enough free space\n");
        return true;
    }

    if (config_.assume_yes && available < config_.total_bytes) {
        fmt::print(stderr, "warning: only {} available for {}, continuing (-y)\n",
                   detail::formatSize(available), detail::formatSize(config_.total_bytes));
        return true;
    }
    return confirmDiskSpace(config_.total_bytes, available, in_, out_);
}

} // namespace binfill
