#include <gtest/gtest.h>

#include "binfill/config.hpp"
#include "binfill/error.hpp"

#include <sstream>
#include <vector>

using namespace binfill;

namespace {

CommandLine parse(std::vector<const char*> args) {
    args.insert(args.begin(), "binfill");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(ConfigTest, parse_size_units) {
    EXPECT_EQ(parseSize("1048576"), kMiB);
    EXPECT_EQ(parseSize("512K"), 512 * kKiB);
    EXPECT_EQ(parseSize("512k"), 512 * kKiB);
    EXPECT_EQ(parseSize("1.5M"), kMiB + kMiB / 2);
    EXPECT_EQ(parseSize("2GiB"), 2 * kGiB);
    EXPECT_EQ(parseSize("3MB"), 3 * kMiB);
    EXPECT_EQ(parseSize("1T"), 1024 * kGiB);
    EXPECT_EQ(parseSize("10B"), 10u);
    EXPECT_EQ(parseSize("0.1M"), 104857u);
}

TEST(ConfigTest, parse_size_rejects_garbage) {
    EXPECT_THROW(parseSize(""), ConfigError);
    EXPECT_THROW(parseSize("abc"), ConfigError);
    EXPECT_THROW(parseSize("-5"), ConfigError);
    EXPECT_THROW(parseSize("1.2.3"), ConfigError);
    EXPECT_THROW(parseSize("10X"), ConfigError);
    EXPECT_THROW(parseSize("10KX"), ConfigError);
    EXPECT_THROW(parseSize("99999999999T"), ConfigError);
}

TEST(ConfigTest, defaults) {
    const auto command_line = parse({});
    const auto& config = command_line.config;

    EXPECT_FALSE(command_line.show_help);
    EXPECT_EQ(config.output_dir.string(), ".");
    EXPECT_EQ(config.total_bytes, 120 * kMiB);
    EXPECT_EQ(config.min_file_size, 100 * kKiB);
    EXPECT_EQ(config.max_file_size, 1100 * kKiB);
    EXPECT_EQ(config.chunk_size, 512 * kKiB);
    EXPECT_DOUBLE_EQ(config.report_interval_seconds, 5.0);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_EQ(config.name_prefix, "d");
    EXPECT_FALSE(config.assume_yes);
    EXPECT_GE(config.effectiveThreads(), 1u);
    EXPECT_LE(config.effectiveThreads(), 16u);
}

TEST(ConfigTest, all_options) {
    const auto command_line = parse({"-d", "/tmp/out", "-n", "1G", "-m", "30M", "-M", "50M", "-c", "1M",
                                     "-i", "0.5", "-t", "4", "-r", "1234", "-p", "chunk", "-y"});
    const auto& config = command_line.config;

    EXPECT_EQ(config.output_dir.string(), "/tmp/out");
    EXPECT_EQ(config.total_bytes, kGiB);
    EXPECT_EQ(config.min_file_size, 30 * kMiB);
    EXPECT_EQ(config.max_file_size, 50 * kMiB);
    EXPECT_EQ(config.chunk_size, kMiB);
    EXPECT_DOUBLE_EQ(config.report_interval_seconds, 0.5);
    EXPECT_EQ(config.threads, 4u);
    EXPECT_EQ(config.effectiveThreads(), 4u);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 1234u);
    EXPECT_EQ(config.name_prefix, "chunk");
    EXPECT_TRUE(config.assume_yes);

    const auto plan = config.planOptions();
    EXPECT_EQ(plan.total_bytes, kGiB);
    EXPECT_EQ(plan.min_item_size, 30 * kMiB);
    EXPECT_EQ(plan.max_item_size, 50 * kMiB);
    EXPECT_EQ(plan.name_prefix, "chunk");

    const auto writer = config.writerOptions();
    EXPECT_EQ(writer.chunk_size, kMiB);
    EXPECT_DOUBLE_EQ(writer.report_interval.count(), 0.5);
}

TEST(ConfigTest, help_stops_parsing) {
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_TRUE(parse({"-n", "1M", "--help", "-bogus"}).show_help);
}

TEST(ConfigTest, rejects_invalid_command_lines) {
    EXPECT_THROW(parse({"-n"}), ConfigError);
    EXPECT_THROW(parse({"-n", "0"}), ConfigError);
    EXPECT_THROW(parse({"-m", "0"}), ConfigError);
    EXPECT_THROW(parse({"-m", "2M", "-M", "1M"}), ConfigError);
    EXPECT_THROW(parse({"-c", "0"}), ConfigError);
    EXPECT_THROW(parse({"-i", "-1"}), ConfigError);
    EXPECT_THROW(parse({"-i", "soon"}), ConfigError);
    EXPECT_THROW(parse({"-t", "0"}), ConfigError);
    EXPECT_THROW(parse({"-t", "1000"}), ConfigError);
    EXPECT_THROW(parse({"-t", "4x"}), ConfigError);
    EXPECT_THROW(parse({"-r", "-3"}), ConfigError);
    EXPECT_THROW(parse({"-p", "a/b"}), ConfigError);
    EXPECT_THROW(parse({"-q", "1"}), ConfigError);
}

TEST(ConfigTest, validate_checks_programmatic_config) {
    GeneratorConfig config;
    EXPECT_NO_THROW(config.validate());

    config.max_file_size = config.min_file_size - 1;
    EXPECT_THROW(config.validate(), ConfigError);

    config = GeneratorConfig{};
    config.threads = 257;
    EXPECT_THROW(config.validate(), ConfigError);

    config = GeneratorConfig{};
    config.name_prefix.clear();
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, usage_lists_options) {
    std::ostringstream out;
    printUsage(out, "binfill");
    const std::string text = out.str();
    for (const char* option : {"-d", "-n", "-m", "-M", "-c", "-i", "-t", "-r", "-p", "-y", "--help"}) {
        EXPECT_NE(text.find(option), std::string::npos) << option;
    }
}
