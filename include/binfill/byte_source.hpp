#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <random>
#include <string>

namespace binfill {

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Fills `size` bytes at `data` with uniformly random bytes.
    // Throws ByteSourceError when no bytes can be produced.
    virtual void fill(std::uint8_t* data, std::size_t size) = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

using ByteSourcePtr = std::unique_ptr<ByteSource>;
using ByteSourceFactory = std::function<ByteSourcePtr()>;

// Reads the kernel entropy pool through /dev/urandom.
class UrandomSource final : public ByteSource {
public:
    explicit UrandomSource(std::string device = "/dev/urandom");

    void fill(std::uint8_t* data, std::size_t size) override;
    [[nodiscard]] std::string name() const override { return device_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::string device_;
    std::unique_ptr<FILE, FileDeleter> file_{};
};

// Userspace mt19937_64 generator, used when the kernel source is unavailable.
class PrngSource final : public ByteSource {
public:
    PrngSource();
    explicit PrngSource(std::uint64_t seed);

    void fill(std::uint8_t* data, std::size_t size) override;
    [[nodiscard]] std::string name() const override { return "mt19937_64"; }

private:
    std::mt19937_64 engine_;
};

// Tries `primary` until it fails once, then stays on `secondary`.
class FallbackByteSource final : public ByteSource {
public:
    FallbackByteSource(ByteSourcePtr primary, ByteSourcePtr secondary);

    void fill(std::uint8_t* data, std::size_t size) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] bool degraded() const noexcept { return degraded_; }

private:
    ByteSourcePtr primary_;
    ByteSourcePtr secondary_;
    bool degraded_{false};
};

// /dev/urandom with the mt19937_64 fallback behind it; one instance per worker.
ByteSourceFactory defaultByteSourceFactory();

} // namespace binfill
