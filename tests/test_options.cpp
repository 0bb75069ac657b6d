#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "core/options.hpp"

#include <vector>

namespace astream::core
{
namespace
{
Options parse(std::vector<const char*> args)
{
    args.insert(args.begin(), {"astream", "send"});
    return parse_options(static_cast<int>(args.size()), args.data(), 2);
}
} // namespace

TEST(Options, FillsConfigFromKeyValuePairsAndFlags)
{
    const auto cfg = make_config(parse({"--chunk", "800", "--overlap", "80", "--layers", "3",
                                        "--rate-limit", "1000", "--timeout-ms", "250",
                                        "--realtime"}));
    EXPECT_EQ(cfg.chunk_length, 800u);
    EXPECT_EQ(cfg.overlap_length, 80u);
    EXPECT_EQ(cfg.quality_layers, 3);
    EXPECT_TRUE(cfg.rate_limit_enabled);
    EXPECT_EQ(cfg.rate_limit_bytes_per_second, 1000u);
    EXPECT_EQ(cfg.io_timeout.count(), 250);
    EXPECT_TRUE(cfg.realtime);
    EXPECT_FALSE(cfg.verbose);
}

TEST(Options, OutOfRangeValuesAreRejectedNotTruncated)
{
    EXPECT_THROW((void)make_config(parse({"--layers", "257"})), ConfigError);
    EXPECT_THROW((void)make_config(parse({"--sample-rate", "4294967296"})), ConfigError);
    EXPECT_THROW((void)number_option(parse({"--port", "70000"}), "port", 8888, 65535), ConfigError);
    EXPECT_EQ(number_option(parse({"--port", "65535"}), "port", 8888, 65535), 65535u);
    EXPECT_EQ(number_option(parse({}), "port", 8888, 65535), 8888u);
}

TEST(Options, MalformedNumbersAreRejected)
{
    EXPECT_THROW((void)make_config(parse({"--chunk", "-1"})), ConfigError);
    EXPECT_THROW((void)make_config(parse({"--chunk", "12abc"})), ConfigError);
    EXPECT_THROW((void)make_config(parse({"--queue", ""})), ConfigError);
    EXPECT_THROW((void)make_config(parse({"--queue", "99999999999999999999999"})), ConfigError);
}

TEST(Options, MalformedCommandLinesAreRejected)
{
    EXPECT_THROW((void)parse({"chunk", "10"}), ConfigError);
    EXPECT_THROW((void)parse({"--chunk"}), ConfigError);
}

} // namespace astream::core
