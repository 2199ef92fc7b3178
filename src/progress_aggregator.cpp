#include "binfill/progress_aggregator.hpp"
#include "binfill/detail/format_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

namespace binfill {

namespace {

double percentOf(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

} // namespace

ProgressAggregator::ProgressAggregator(EventChannel& channel, std::size_t total_items,
                                       std::uint64_t total_bytes, std::ostream& out,
                                       std::chrono::milliseconds tick,
                                       std::chrono::milliseconds stall_after)
    : channel_(channel),
    out_(out),
    tick_(tick),
    stall_after_(stall_after),
    start_time_(std::chrono::steady_clock::now()) {
    tally_.total_items = total_items;
    tally_.total_bytes = total_bytes;
}

GlobalTally ProgressAggregator::run() {
    start_time_ = std::chrono::steady_clock::now();
    printLine(fmt::format("Progress monitor started, {} files / {} planned",
                          tally_.total_items, detail::formatSize(tally_.total_bytes)));
    out_ << std::string(100, '=') << '\n';

    while (!finished()) {
        std::optional<ProgressEvent> event = channel_.receive(tick_);
        if (event) {
            handle(*event);
        } else if (channel_.isDrained()) {
            fmt::print(stderr, "warning: event channel closed with {} of {} files unaccounted for\n",
                       tally_.total_items - tally_.finishedItems(), tally_.total_items);
            break;
        }

        reportStalledWorkers(std::chrono::steady_clock::now());
    }

    printSummary();
    out_ << std::flush;
    return tally_;
}

void ProgressAggregator::handle(const ProgressEvent& event) {
    std::visit(
        [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, StartedEvent>) {
                onStarted(e);
            } else if constexpr (std::is_same_v<T, ProgressUpdateEvent>) {
                onProgress(e);
            } else if constexpr (std::is_same_v<T, CompletedEvent>) {
                onCompleted(e);
            } else {
                onFailed(e);
            }
        },
        event);
}

void ProgressAggregator::reportStalledWorkers(std::chrono::steady_clock::time_point now) {
    for (auto& [worker_id, state] : workers_) {
        if (state.stall_reported || now - state.last_update < stall_after_) {
            continue;
        }
        state.stall_reported = true;
        const double silent = std::chrono::duration<double>(now - state.last_update).count();
        printLine(fmt::format("worker {:>3}: no progress on {} for {:.0f} s ({}/{})",
                              worker_id, state.item_name, silent,
                              detail::formatSize(state.bytes_written), detail::formatSize(state.target_size)));
    }
}

bool ProgressAggregator::finished() const noexcept {
    return tally_.finishedItems() >= tally_.total_items;
}

void ProgressAggregator::onStarted(const StartedEvent& event) {
    WorkerState& state = workers_[event.worker_id];
    state.item_name = event.item_name;
    state.bytes_written = 0;
    state.target_size = event.target_size;
    state.rate_mb_per_s = 0.0;
    state.last_update = std::chrono::steady_clock::now();
    state.stall_reported = false;

    printLine(fmt::format("worker {:>3} started  {:<12} ({:>10})",
                          event.worker_id, event.item_name, detail::formatSize(event.target_size)));
}

void ProgressAggregator::onProgress(const ProgressUpdateEvent& event) {
    WorkerState& state = workers_[event.worker_id];
    if (state.item_name != event.item_name) {
        state.item_name = event.item_name;
        state.bytes_written = 0;
    }
    state.bytes_written = std::max(state.bytes_written, event.bytes_written);
    state.target_size = event.target_size;
    state.rate_mb_per_s = event.rate_mb_per_s;
    state.last_update = std::chrono::steady_clock::now();
    state.stall_reported = false;

    printLine(fmt::format("worker {:>3}: {:<12} - {:5.1f}% ({}/{}) - {:6.2f} MB/s",
                          event.worker_id, event.item_name,
                          percentOf(state.bytes_written, state.target_size),
                          detail::formatSize(state.bytes_written), detail::formatSize(state.target_size),
                          state.rate_mb_per_s));
}

void ProgressAggregator::onCompleted(const CompletedEvent& event) {
    printLine(fmt::format("worker {:>3} finished {:<12} - {:8.2f} s, {:6.2f} MB/s",
                          event.worker_id, event.item_name, event.elapsed_seconds, event.rate_mb_per_s));

    const auto it = workers_.find(event.worker_id);
    if (it != workers_.end() && it->second.item_name == event.item_name) {
        tally_.completed_bytes += it->second.target_size;
        workers_.erase(it);
    } else {
        fmt::print(stderr, "warning: completion of {} from worker {} without a start event\n",
                   event.item_name, event.worker_id);
    }
    ++tally_.completed_items;

    printLine(formatTally());
    out_ << std::string(100, '-') << '\n';
}

void ProgressAggregator::onFailed(const FailedEvent& event) {
    printLine(fmt::format("worker {:>3} failed   {:<12}: {}",
                          event.worker_id, event.item_name, event.error_message));

    const auto it = workers_.find(event.worker_id);
    if (it != workers_.end() && it->second.item_name == event.item_name) {
        tally_.failed_bytes += it->second.target_size;
        workers_.erase(it);
    }
    ++tally_.failed_items;
    tally_.failures.emplace_back(event.item_name, event.error_message);
}

std::string ProgressAggregator::formatTally() const {
    const double elapsed = elapsedSeconds();
    return fmt::format("Overall: {:5.1f}% ({} / {}) - {:6.2f} MB/s ({:.2f} GB/h) - completed {}/{} files",
                       percentOf(tally_.completed_bytes, tally_.total_bytes),
                       detail::formatSize(tally_.completed_bytes), detail::formatSize(tally_.total_bytes),
                       detail::rateMbPerSecond(tally_.completed_bytes, elapsed),
                       detail::gbPerHour(tally_.completed_bytes, elapsed),
                       tally_.completed_items, tally_.total_items);
}

void ProgressAggregator::printSummary() {
    const double elapsed = elapsedSeconds();

    out_ << std::string(100, '=') << '\n';
    out_ << fmt::format("Generated {} of {} files", tally_.completed_items, tally_.total_items) << '\n';
    out_ << fmt::format("Total size:    {} of {}", detail::formatSize(tally_.completed_bytes),
                        detail::formatSize(tally_.total_bytes)) << '\n';
    out_ << fmt::format("Total time:    {:.2f} s", elapsed) << '\n';
    out_ << fmt::format("Average speed: {:.2f} MB/s ({:.2f} GB/h)",
                        detail::rateMbPerSecond(tally_.completed_bytes, elapsed),
                        detail::gbPerHour(tally_.completed_bytes, elapsed)) << '\n';

    if (!tally_.failures.empty()) {
        out_ << fmt::format("Failed files:  {} ({})", tally_.failed_items,
                            detail::formatSize(tally_.failed_bytes)) << '\n';
        for (const auto& [name, error] : tally_.failures) {
            out_ << fmt::format("  {}: {}", name, error) << '\n';
        }
    }
}

void ProgressAggregator::printLine(const std::string& line) {
    out_ << '[' << detail::timestamp() << "] " << line << '\n';
}

double ProgressAggregator::elapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
}

} // namespace binfill
