#include <gtest/gtest.h>

#include "binfill/config.hpp"
#include "binfill/event_channel.hpp"
#include "binfill/progress_aggregator.hpp"

#include <sstream>
#include <thread>

using namespace binfill;
using namespace std::chrono_literals;

TEST(ProgressAggregatorTest, worker_table_follows_events) {
    EventChannel channel;
    std::ostringstream out;
    ProgressAggregator aggregator(channel, 2, 3 * kMiB, out);

    aggregator.handle(StartedEvent{0, "d0000.bin", kMiB});
    aggregator.handle(StartedEvent{1, "d0001.bin", 2 * kMiB});
    ASSERT_EQ(aggregator.workers().size(), 2u);
    EXPECT_EQ(aggregator.workers().at(1).target_size, 2 * kMiB);

    aggregator.handle(ProgressUpdateEvent{1, "d0001.bin", kMiB, 2 * kMiB, 1.0, 1.0});
    EXPECT_EQ(aggregator.workers().at(1).bytes_written, kMiB);
    EXPECT_DOUBLE_EQ(aggregator.workers().at(1).rate_mb_per_s, 1.0);

    aggregator.handle(CompletedEvent{0, "d0000.bin", 0.5, 2.0});
    EXPECT_EQ(aggregator.workers().size(), 1u);
    EXPECT_EQ(aggregator.tally().completed_items, 1u);
    EXPECT_EQ(aggregator.tally().completed_bytes, kMiB);
    EXPECT_FALSE(aggregator.finished());

    aggregator.handle(CompletedEvent{1, "d0001.bin", 2.0, 1.0});
    EXPECT_TRUE(aggregator.workers().empty());
    EXPECT_EQ(aggregator.tally().completed_bytes, 3 * kMiB);
    EXPECT_TRUE(aggregator.finished());

    const std::string text = out.str();
    EXPECT_NE(text.find("d0001.bin"), std::string::npos);
    EXPECT_NE(text.find("completed 2/2 files"), std::string::npos);
}

TEST(ProgressAggregatorTest, slot_reuse_keys_by_worker) {
    EventChannel channel;
    std::ostringstream out;
    ProgressAggregator aggregator(channel, 2, 2 * kKiB, out);

    aggregator.handle(StartedEvent{0, "a", kKiB});
    aggregator.handle(CompletedEvent{0, "a", 0.1, 0.0});
    aggregator.handle(StartedEvent{0, "b", kKiB});
    ASSERT_EQ(aggregator.workers().size(), 1u);
    EXPECT_EQ(aggregator.workers().at(0).item_name, "b");
    aggregator.handle(CompletedEvent{0, "b", 0.1, 0.0});

    EXPECT_EQ(aggregator.tally().completed_items, 2u);
    EXPECT_EQ(aggregator.tally().completed_bytes, 2 * kKiB);
}

TEST(ProgressAggregatorTest, tally_excludes_failed_items) {
    EventChannel channel;
    std::ostringstream out;
    // N = 4 items, B = 10K; the 3K item fails, so F = 3K
    const std::uint64_t sizes[] = {kKiB, 2 * kKiB, 3 * kKiB, 4 * kKiB};
    ProgressAggregator aggregator(channel, 4, 10 * kKiB, out, 10ms);

    for (std::size_t i = 0; i < 4; ++i) {
        const std::string name = "d000" + std::to_string(i) + ".bin";
        channel.emit(StartedEvent{i, name, sizes[i]});
        if (i == 2) {
            channel.emit(FailedEvent{i, name, "disk on fire"});
        } else {
            channel.emit(CompletedEvent{i, name, 1.0, 1.0});
        }
    }

    const auto tally = aggregator.run();

    EXPECT_EQ(tally.completed_items, 3u);
    EXPECT_EQ(tally.completed_bytes, 7 * kKiB);
    EXPECT_EQ(tally.failed_items, 1u);
    EXPECT_EQ(tally.failed_bytes, 3 * kKiB);
    ASSERT_EQ(tally.failures.size(), 1u);
    EXPECT_EQ(tally.failures[0].first, "d0002.bin");
    EXPECT_EQ(tally.failures[0].second, "disk on fire");

    const std::string text = out.str();
    EXPECT_NE(text.find("Generated 3 of 4 files"), std::string::npos);
    EXPECT_NE(text.find("d0002.bin: disk on fire"), std::string::npos);
}

TEST(ProgressAggregatorTest, run_drains_concurrent_producer) {
    EventChannel channel;
    std::ostringstream out;
    ProgressAggregator aggregator(channel, 3, 3 * kMiB, out, 50ms);

    std::thread producer([&channel]() {
        for (std::size_t i = 0; i < 3; ++i) {
            const std::string name = "d000" + std::to_string(i) + ".bin";
            channel.emit(StartedEvent{0, name, kMiB});
            channel.emit(ProgressUpdateEvent{0, name, kMiB / 2, kMiB, 0.1, 5.0});
            std::this_thread::sleep_for(5ms);
            channel.emit(CompletedEvent{0, name, 0.2, 5.0});
        }
    });

    const auto tally = aggregator.run();
    producer.join();

    EXPECT_EQ(tally.completed_items, 3u);
    EXPECT_EQ(tally.completed_bytes, 3 * kMiB);
    EXPECT_EQ(tally.total_items, 3u);
    EXPECT_EQ(tally.total_bytes, 3 * kMiB);
    EXPECT_NE(out.str().find("100.0%"), std::string::npos);
}

TEST(ProgressAggregatorTest, closed_channel_ends_run_early) {
    EventChannel channel;
    std::ostringstream out;
    ProgressAggregator aggregator(channel, 5, 5 * kKiB, out, 10ms);

    channel.emit(StartedEvent{0, "d0000.bin", kKiB});
    channel.emit(CompletedEvent{0, "d0000.bin", 0.1, 0.0});
    channel.close();

    const auto tally = aggregator.run();
    EXPECT_EQ(tally.completed_items, 1u);
    EXPECT_FALSE(aggregator.finished());
}

TEST(ProgressAggregatorTest, empty_plan_finishes_immediately) {
    EventChannel channel;
    std::ostringstream out;
    ProgressAggregator aggregator(channel, 0, 0, out);

    const auto tally = aggregator.run();
    EXPECT_EQ(tally.finishedItems(), 0u);
    EXPECT_NE(out.str().find("Generated 0 of 0 files"), std::string::npos);
}

TEST(ProgressAggregatorTest, silent_worker_is_reported_once) {
    EventChannel channel;
    std::ostringstream out;
    ProgressAggregator aggregator(channel, 1, kKiB, out, 5ms, 20ms);

    std::thread producer([&channel]() {
        channel.emit(StartedEvent{4, "d0000.bin", kKiB});
        std::this_thread::sleep_for(150ms);
        channel.emit(CompletedEvent{4, "d0000.bin", 0.15, 0.0});
    });

    const auto tally = aggregator.run();
    producer.join();

    EXPECT_EQ(tally.completed_items, 1u);
    const std::string text = out.str();
    const auto first = text.find("worker   4: no progress on d0000.bin");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("no progress", first + 1), std::string::npos);
}

TEST(ProgressAggregatorTest, active_worker_is_not_reported) {
    EventChannel channel;
    std::ostringstream out;
    ProgressAggregator aggregator(channel, 1, kKiB, out, 5ms, std::chrono::milliseconds(60000));

    channel.emit(StartedEvent{0, "d0000.bin", kKiB});
    channel.emit(CompletedEvent{0, "d0000.bin", 0.1, 0.0});
    aggregator.run();

    EXPECT_EQ(out.str().find("no progress"), std::string::npos);
}
