#pragma once

#include <stdexcept>
#include <string>

namespace binfill {

// Invalid sizes, bounds or command line options. Raised before any file is touched.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// A random byte source could not produce the requested block.
class ByteSourceError : public std::runtime_error {
public:
    explicit ByteSourceError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace binfill
