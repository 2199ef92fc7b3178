#pragma once

#include <cstdint>
#include <string>

namespace binfill {

struct WorkItem {
    std::string name;
    std::uint64_t target_size{0};
};

inline bool operator==(const WorkItem& lhs, const WorkItem& rhs) {
    return lhs.name == rhs.name && lhs.target_size == rhs.target_size;
}

} // namespace binfill
