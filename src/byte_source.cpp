#include "binfill/byte_source.hpp"
#include "binfill/error.hpp"

#include <cerrno>
#include <exception>
#include <chrono>
#include <cstring>
#include <utility>

#include <fmt/format.h>

namespace binfill {

UrandomSource::UrandomSource(std::string device) : device_(std::move(device)) {}

void UrandomSource::fill(std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (!file_) {
        file_.reset(std::fopen(device_.c_str(), "rb"));
        if (!file_) {
            throw ByteSourceError(fmt::format("Cannot open {}: {}", device_, std::strerror(errno)));
        }
        // Unbuffered: reads go straight to the device in chunk-sized requests.
        std::setvbuf(file_.get(), nullptr, _IONBF, 0);
    }

    const std::size_t got = std::fread(data, 1, size, file_.get());
    if (got != size) {
        const bool eof = std::feof(file_.get()) != 0;
        file_.reset();
        throw ByteSourceError(fmt::format("Short read from {} ({} of {} bytes){}",
                                          device_, got, size, eof ? ", end of stream" : ""));
    }
}

PrngSource::PrngSource() {
    std::random_device rd;
    const auto now = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    std::seed_seq seq{rd(), rd(), static_cast<std::uint32_t>(now), static_cast<std::uint32_t>(now >> 32)};
    engine_.seed(seq);
}

PrngSource::PrngSource(std::uint64_t seed) : engine_(seed) {}

void PrngSource::fill(std::uint8_t* data, std::size_t size) {
    std::size_t i = 0;
    while (i + sizeof(std::uint64_t) <= size) {
        const std::uint64_t value = engine_();
        std::memcpy(data + i, &value, sizeof(value));
        i += sizeof(value);
    }
    if (i < size) {
        const std::uint64_t value = engine_();
        std::memcpy(data + i, &value, size - i);
    }
}

FallbackByteSource::FallbackByteSource(ByteSourcePtr primary, ByteSourcePtr secondary)
    : primary_(std::move(primary)), secondary_(std::move(secondary)) {
    if (!primary_) {
        degraded_ = true;
    }
    if (!secondary_) {
        throw ByteSourceError("Fallback byte source requires a secondary source");
    }
}

void FallbackByteSource::fill(std::uint8_t* data, std::size_t size) {
    std::string primary_error;
    if (!degraded_) {
        try {
            primary_->fill(data, size);
            return;
        } catch (const std::exception& ex) {
            primary_error = ex.what();
            degraded_ = true;
            fmt::print(stderr, "warning: random source {} failed ({}), falling back to {}\n",
                       primary_->name(), primary_error, secondary_->name());
        }
    }

    try {
        secondary_->fill(data, size);
    } catch (const std::exception& ex) {
        if (primary_error.empty()) {
            throw ByteSourceError(fmt::format("Fallback random source {} failed: {}",
                                              secondary_->name(), ex.what()));
        }
        throw ByteSourceError(fmt::format("Random sources exhausted: {}: {}; {}: {}",
                                          primary_->name(), primary_error,
                                          secondary_->name(), ex.what()));
    }
}

std::string FallbackByteSource::name() const {
    if (degraded_ || !primary_) {
        return secondary_->name();
    }
    return primary_->name();
}

ByteSourceFactory defaultByteSourceFactory() {
    return [] {
        return std::make_unique<FallbackByteSource>(std::make_unique<UrandomSource>(),
                                                    std::make_unique<PrngSource>());
    };
}

} // namespace binfill
