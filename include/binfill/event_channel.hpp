#pragma once

#include "progress.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace binfill {

// Unbounded multi-producer / single-consumer queue of progress events.
// emit() never blocks on the consumer; events of one producer keep their order.
class EventChannel final : public EventSink {
public:
    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void emit(ProgressEvent event) override;

    // Waits up to `timeout` for the next event. Returns nullopt on timeout or
    // when the channel is closed and drained.
    [[nodiscard]] std::optional<ProgressEvent> receive(std::chrono::milliseconds timeout);

    // Events emitted after close() are dropped. Pending events stay receivable.
    void close();

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] bool isDrained() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<ProgressEvent> queue_;
    bool closed_{false};
};

} // namespace binfill
