#pragma once

#include "byte_source.hpp"
#include "file_writer_task.hpp"
#include "progress.hpp"
#include "work_item.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace binfill {

struct FailedItem {
    WorkItem item;
    std::string error_message;
};

struct PoolResult {
    std::size_t workers{0};
    std::size_t completed{0};
    std::vector<FailedItem> failed;
};

// Runs one FileWriterTask per work item on a fixed number of worker slots.
// Slots pull the next undispatched item as soon as their current one finishes,
// whatever its outcome, so one failed item never stops the rest of the batch.
class WorkerPool {
public:
    WorkerPool(std::size_t concurrency, std::filesystem::path directory,
               WriterOptions writer_options = {},
               ByteSourceFactory source_factory = defaultByteSourceFactory());

    // Blocks until every item is completed or failed. Failed items are
    // returned in plan order.
    PoolResult run(const std::vector<WorkItem>& items, EventSink& sink);

    // Number of slots run() will start for `item_count` items.
    [[nodiscard]] std::size_t slotCount(std::size_t item_count) const noexcept;

    // min(hardware threads, cap), at least one.
    static std::size_t defaultConcurrency(std::size_t cap = 16);

private:
    struct SlotResult {
        std::size_t completed{0};
        std::vector<std::pair<std::size_t, FailedItem>> failed;
    };

    void runSlot(std::size_t worker_id, const std::vector<WorkItem>& items, EventSink& sink,
                 SlotResult& result);

    std::size_t concurrency_;
    std::filesystem::path directory_;
    WriterOptions writer_options_;
    ByteSourceFactory source_factory_;

    std::vector<std::thread> threads_;
    std::atomic<std::size_t> next_item_{0};
};

} // namespace binfill
