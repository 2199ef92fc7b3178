#pragma once

#include "byte_source.hpp"
#include "config.hpp"
#include "progress_aggregator.hpp"
#include "work_item.hpp"
#include "worker_pool.hpp"

#include <iostream>
#include <optional>
#include <vector>

namespace binfill {

struct SessionResult {
    std::vector<WorkItem> plan;
    PoolResult pool;
    GlobalTally tally;
};

// One generation run: pre-flight check, plan, then the worker pool on a
// background thread with the progress aggregator on the calling thread.
class GenerationSession {
public:
    explicit GenerationSession(GeneratorConfig config, std::ostream& out = std::cout,
                               std::istream& in = std::cin,
                               ByteSourceFactory source_factory = defaultByteSourceFactory());

    // nullopt when the operator declined to continue with too little disk space.
    std::optional<SessionResult> run();

private:
    void prepareOutputDirectory();
    bool preflight();

    GeneratorConfig config_;
    std::ostream& out_;
    std::istream& in_;
    ByteSourceFactory source_factory_;
};

} // namespace binfill
