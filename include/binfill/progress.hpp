#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace binfill {

struct StartedEvent {
    std::size_t worker_id{0};
    std::string item_name;
    std::uint64_t target_size{0};
};

struct ProgressUpdateEvent {
    std::size_t worker_id{0};
    std::string item_name;
    std::uint64_t bytes_written{0};
    std::uint64_t target_size{0};
    double elapsed_seconds{0.0};
    double rate_mb_per_s{0.0};
};

struct CompletedEvent {
    std::size_t worker_id{0};
    std::string item_name;
    double elapsed_seconds{0.0};
    double rate_mb_per_s{0.0};
};

struct FailedEvent {
    std::size_t worker_id{0};
    std::string item_name;
    std::string error_message;
};

using ProgressEvent = std::variant<StartedEvent, ProgressUpdateEvent, CompletedEvent, FailedEvent>;

// Write side of the event channel as seen by a task.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void emit(ProgressEvent event) = 0;
};

[[nodiscard]] inline std::size_t workerOf(const ProgressEvent& event) {
    return std::visit([](const auto& e) { return e.worker_id; }, event);
}

[[nodiscard]] inline const std::string& itemOf(const ProgressEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.item_name; }, event);
}

} // namespace binfill
