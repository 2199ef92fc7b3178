#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>

namespace binfill {

// Bytes available to an unprivileged writer on the filesystem holding `path`.
// Throws std::filesystem::filesystem_error when the query fails.
std::uint64_t availableBytes(const std::filesystem::path& path);

// `path` itself if it exists, otherwise its closest existing ancestor.
std::filesystem::path existingAncestor(const std::filesystem::path& path);

// Returns true when `available` covers `required`, or when the operator
// answers "y" to the prompt written to `out`.
bool confirmDiskSpace(std::uint64_t required, std::uint64_t available, std::istream& in, std::ostream& out);

} // namespace binfill
