#pragma once

#include "work_item.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace binfill {

struct PlanOptions {
    std::uint64_t total_bytes{0};
    std::uint64_t min_item_size{0};
    std::uint64_t max_item_size{0};
    std::optional<std::uint64_t> seed;
    std::string name_prefix{"d"};
    std::string name_extension{".bin"};
};

// Splits a byte budget into randomly sized work items.
//
// Sizes are drawn uniformly from [min, min(max, remaining)]. Once less than
// `min` remains, the rest becomes one final undersized item. Names are the
// zero-padded item index between prefix and extension, at least four digits
// wide and wide enough for the last index, so they sort in plan order.
class WorkPlanner {
public:
    explicit WorkPlanner(PlanOptions options);

    [[nodiscard]] std::vector<WorkItem> plan();

    // Upper bound on plan() iterations: ceil(total / min).
    [[nodiscard]] std::uint64_t maxItemCount() const noexcept;

    static std::string itemName(const std::string& prefix, std::size_t index, std::size_t width,
                                const std::string& extension);

private:
    PlanOptions options_;
    std::mt19937_64 engine_;
};

} // namespace binfill
