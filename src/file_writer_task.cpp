#include "binfill/file_writer_task.hpp"
#include "binfill/detail/format_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <exception>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace binfill {

class FileWriterTask::Impl {
public:
    Impl(WorkItem item, std::filesystem::path directory, WriterOptions options)
        : item_(std::move(item)),
        destination_(std::move(directory) / item_.name),
        options_(options) {
        options_.chunk_size = std::max<std::size_t>(1, options_.chunk_size);
    }

    void run(std::size_t worker_id, ByteSource& source, EventSink& sink) {
        using Clock = std::chrono::steady_clock;

        bytes_written_ = 0;
        sink.emit(StartedEvent{worker_id, item_.name, item_.target_size});

        const auto start_time = Clock::now();
        auto last_report = start_time;

        try {
            openExclusive();

            std::vector<std::uint8_t> buffer(static_cast<std::size_t>(
                std::min<std::uint64_t>(options_.chunk_size, item_.target_size)));

            while (bytes_written_ < item_.target_size) {
                const auto current_chunk = static_cast<std::size_t>(
                    std::min<std::uint64_t>(options_.chunk_size, item_.target_size - bytes_written_));

                source.fill(buffer.data(), current_chunk);
                writeChunk(buffer.data(), current_chunk);
                bytes_written_ += current_chunk;

                const auto now = Clock::now();
                if (now - last_report >= options_.report_interval) {
                    const double elapsed = std::chrono::duration<double>(now - start_time).count();
                    sink.emit(ProgressUpdateEvent{worker_id, item_.name, bytes_written_, item_.target_size,
                                                  elapsed, detail::rateMbPerSecond(bytes_written_, elapsed)});
                    last_report = now;
                }
            }

            closeOutput();
        } catch (const std::exception& ex) {
            file_.reset();
            sink.emit(FailedEvent{worker_id, item_.name, ex.what()});
            throw;
        }

        const double elapsed = std::chrono::duration<double>(Clock::now() - start_time).count();
        sink.emit(CompletedEvent{worker_id, item_.name, elapsed,
                                 detail::rateMbPerSecond(item_.target_size, elapsed)});
    }

    [[nodiscard]] const WorkItem& item() const { return item_; }
    [[nodiscard]] const std::filesystem::path& destination() const { return destination_; }
    [[nodiscard]] std::uint64_t bytesWritten() const { return bytes_written_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void openExclusive() {
        // "x": fail with EEXIST instead of truncating an existing file
        file_.reset(std::fopen(destination_.c_str(), "wbx"));
        if (!file_) {
            throw std::system_error(errno, std::generic_category(),
                                    "Cannot create " + destination_.string());
        }
    }

    void writeChunk(const std::uint8_t* data, std::size_t size) {
        const std::size_t written = std::fwrite(data, 1, size, file_.get());
        if (written != size) {
            throw std::system_error(errno, std::generic_category(),
                                    "Failed to write " + destination_.string());
        }
    }

    void closeOutput() {
        FILE* fp = file_.release();
        const bool flushed = std::fflush(fp) == 0;
        const int flush_errno = errno;
        if (std::fclose(fp) != 0 || !flushed) {
            throw std::system_error(flushed ? errno : flush_errno, std::generic_category(),
                                    "Failed to close " + destination_.string());
        }
    }

    WorkItem item_;
    std::filesystem::path destination_;
    WriterOptions options_;

    std::unique_ptr<FILE, FileDeleter> file_{};
    std::uint64_t bytes_written_{0};
};

FileWriterTask::FileWriterTask(WorkItem item, std::filesystem::path directory, WriterOptions options)
    : impl_(std::make_unique<Impl>(std::move(item), std::move(directory), options)) {}

FileWriterTask::~FileWriterTask() = default;

void FileWriterTask::run(std::size_t worker_id, ByteSource& source, EventSink& sink) {
    impl_->run(worker_id, source, sink);
}

const WorkItem& FileWriterTask::item() const { return impl_->item(); }

std::filesystem::path FileWriterTask::destination() const { return impl_->destination(); }

std::uint64_t FileWriterTask::bytesWritten() const { return impl_->bytesWritten(); }

} // namespace binfill
