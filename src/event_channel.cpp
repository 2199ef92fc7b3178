#include "binfill/event_channel.hpp"

#include <utility>

namespace binfill {

void EventChannel::emit(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(event));
    }
    not_empty_.notify_one();
}

std::optional<ProgressEvent> EventChannel::receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

bool EventChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool EventChannel::isDrained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace binfill
