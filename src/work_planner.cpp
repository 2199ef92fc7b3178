#include "binfill/work_planner.hpp"
#include "binfill/error.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace binfill {

namespace {

std::size_t decimalDigits(std::size_t value) {
    std::size_t digits = 1;
    while (value >= 10) {
        value /= 10;
        ++digits;
    }
    return digits;
}

} // namespace

WorkPlanner::WorkPlanner(PlanOptions options) : options_(std::move(options)) {
    if (options_.total_bytes == 0) {
        throw ConfigError("Total size must be greater than zero");
    }
    if (options_.min_item_size == 0) {
        throw ConfigError("Minimum file size must be greater than zero");
    }
    if (options_.max_item_size < options_.min_item_size) {
        throw ConfigError(fmt::format("Maximum file size ({}) is smaller than minimum file size ({})",
                                      options_.max_item_size, options_.min_item_size));
    }

    if (options_.seed) {
        engine_.seed(*options_.seed);
    } else {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        engine_.seed(seq);
    }
}

std::vector<WorkItem> WorkPlanner::plan() {
    std::vector<std::uint64_t> sizes;
    sizes.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(maxItemCount(), 1u << 20)));

    std::uint64_t remaining = options_.total_bytes;
    while (remaining > 0) {
        std::uint64_t size = remaining;
        if (remaining >= options_.min_item_size) {
            const std::uint64_t upper = std::min(options_.max_item_size, remaining);
            std::uniform_int_distribution<std::uint64_t> dist(options_.min_item_size, upper);
            size = dist(engine_);
        }
        sizes.push_back(size);
        remaining -= size;
    }

    const std::size_t width = std::max<std::size_t>(4, decimalDigits(sizes.size() - 1));

    std::vector<WorkItem> items;
    items.reserve(sizes.size());
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        items.push_back({itemName(options_.name_prefix, i, width, options_.name_extension), sizes[i]});
    }
    return items;
}

std::uint64_t WorkPlanner::maxItemCount() const noexcept {
    return (options_.total_bytes + options_.min_item_size - 1) / options_.min_item_size;
}

std::string WorkPlanner::itemName(const std::string& prefix, std::size_t index, std::size_t width,
                                  const std::string& extension) {
    return fmt::format("{}{:0{}}{}", prefix, index, width, extension);
}

} // namespace binfill
