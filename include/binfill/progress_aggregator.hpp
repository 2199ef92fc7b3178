#pragma once

#include "event_channel.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace binfill {

struct WorkerState {
    std::string item_name;
    std::uint64_t bytes_written{0};
    std::uint64_t target_size{0};
    double rate_mb_per_s{0.0};
    std::chrono::steady_clock::time_point last_update{};
    bool stall_reported{false};
};

struct GlobalTally {
    std::size_t completed_items{0};
    std::uint64_t completed_bytes{0};
    std::size_t failed_items{0};
    std::uint64_t failed_bytes{0};
    std::size_t total_items{0};
    std::uint64_t total_bytes{0};
    // (item name, error) in the order the failures arrived
    std::vector<std::pair<std::string, std::string>> failures;

    [[nodiscard]] std::size_t finishedItems() const noexcept { return completed_items + failed_items; }
};

// Single consumer of the event channel. Owns the per-worker table and the
// global tally; nothing else reads or writes them while run() is active.
class ProgressAggregator {
public:
    ProgressAggregator(EventChannel& channel, std::size_t total_items, std::uint64_t total_bytes,
                       std::ostream& out = std::cout,
                       std::chrono::milliseconds tick = std::chrono::milliseconds(1000),
                       std::chrono::milliseconds stall_after = std::chrono::milliseconds(60000));

    // Drains events until every item has finished, or the channel is closed
    // and empty, then prints the final summary.
    GlobalTally run();

    void handle(const ProgressEvent& event);

    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] const GlobalTally& tally() const noexcept { return tally_; }
    [[nodiscard]] const std::map<std::size_t, WorkerState>& workers() const noexcept { return workers_; }

private:
    void onStarted(const StartedEvent& event);
    void onProgress(const ProgressUpdateEvent& event);
    void onCompleted(const CompletedEvent& event);
    void onFailed(const FailedEvent& event);

    // Flags, once per silence, workers whose last event is older than stall_after.
    void reportStalledWorkers(std::chrono::steady_clock::time_point now);

    std::string formatTally() const;
    void printSummary();
    void printLine(const std::string& line);

    [[nodiscard]] double elapsedSeconds() const;

    EventChannel& channel_;
    std::ostream& out_;
    std::chrono::milliseconds tick_;
    std::chrono::milliseconds stall_after_;
    std::chrono::steady_clock::time_point start_time_;

    std::map<std::size_t, WorkerState> workers_;
    GlobalTally tally_;
};

} // namespace binfill
