#pragma once

#include "byte_source.hpp"
#include "progress.hpp"
#include "work_item.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace binfill {

struct WriterOptions {
    std::size_t chunk_size{512 * 1024};
    std::chrono::duration<double> report_interval{5.0};
};

// Streams random bytes into one new file until it holds exactly item.target_size bytes.
class FileWriterTask {
public:
    FileWriterTask(WorkItem item, std::filesystem::path directory, WriterOptions options = {});
    ~FileWriterTask();

    FileWriterTask(const FileWriterTask&) = delete;
    FileWriterTask& operator=(const FileWriterTask&) = delete;

    // Emits Started, rate-limited Progress and finally Completed or Failed on `sink`.
    // After emitting Failed the error is rethrown to the caller. The output is
    // opened exclusively, so an existing file fails the item.
    void run(std::size_t worker_id, ByteSource& source, EventSink& sink);

    [[nodiscard]] const WorkItem& item() const;
    [[nodiscard]] std::filesystem::path destination() const;
    [[nodiscard]] std::uint64_t bytesWritten() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace binfill
