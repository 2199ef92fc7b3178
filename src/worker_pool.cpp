#include "binfill/worker_pool.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace binfill {

WorkerPool::WorkerPool(std::size_t concurrency, std::filesystem::path directory,
                       WriterOptions writer_options, ByteSourceFactory source_factory)
    : concurrency_(std::max<std::size_t>(1, concurrency)),
    directory_(std::move(directory)),
    writer_options_(writer_options),
    source_factory_(std::move(source_factory)) {
    if (!source_factory_) {
        source_factory_ = defaultByteSourceFactory();
    }
}

PoolResult WorkerPool::run(const std::vector<WorkItem>& items, EventSink& sink) {
    PoolResult result;
    const std::size_t slots = slotCount(items.size());
    result.workers = slots;
    if (slots == 0) {
        return result;
    }

    next_item_.store(0);
    std::vector<SlotResult> slot_results(slots);

    threads_.reserve(slots);
    for (std::size_t worker_id = 0; worker_id < slots; ++worker_id) {
        try {
            threads_.emplace_back([this, worker_id, &items, &sink, &slot_results]() {
                runSlot(worker_id, items, sink, slot_results[worker_id]);
            });
        } catch (const std::system_error& ex) {
            // Running slots share the dispatch cursor and will pick up every item.
            if (threads_.empty()) {
                throw;
            }
            fmt::print(stderr, "warning: started only {} of {} worker threads: {}\n",
                       threads_.size(), slots, ex.what());
            break;
        }
    }
    result.workers = threads_.size();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    std::vector<std::pair<std::size_t, FailedItem>> failed;
    for (auto& slot : slot_results) {
        result.completed += slot.completed;
        for (auto& entry : slot.failed) {
            failed.push_back(std::move(entry));
        }
    }
    std::sort(failed.begin(), failed.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    result.failed.reserve(failed.size());
    for (auto& entry : failed) {
        result.failed.push_back(std::move(entry.second));
    }
    return result;
}

void WorkerPool::runSlot(std::size_t worker_id, const std::vector<WorkItem>& items, EventSink& sink,
                         SlotResult& result) {
    // Built once per slot, before the first item is claimed.
    ByteSourcePtr source;
    std::string source_error;
    try {
        source = source_factory_();
        if (!source) {
            source_error = "No random source available";
        }
    } catch (const std::exception& ex) {
        source_error = ex.what();
    }

    while (true) {
        const std::size_t index = next_item_.fetch_add(1);
        if (index >= items.size()) {
            break;
        }
        const WorkItem& item = items[index];

        if (!source) {
            // Keep the Started/Failed contract even when this slot has nothing to write with.
            sink.emit(StartedEvent{worker_id, item.name, item.target_size});
            sink.emit(FailedEvent{worker_id, item.name, source_error});
            result.failed.emplace_back(index, FailedItem{item, source_error});
            continue;
        }

        FileWriterTask task(item, directory_, writer_options_);
        try {
            task.run(worker_id, *source, sink);
            ++result.completed;
        } catch (const std::exception& ex) {
            result.failed.emplace_back(index, FailedItem{item, ex.what()});
        }
    }
}

std::size_t WorkerPool::slotCount(std::size_t item_count) const noexcept {
    return std::min(concurrency_, item_count);
}

std::size_t WorkerPool::defaultConcurrency(std::size_t cap) {
    const std::size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    return std::max<std::size_t>(1, std::min(hardware, cap));
}

} // namespace binfill
