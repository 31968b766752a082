#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <spdlog/logger.h>
#include <string>

#include "pool_cpp/config.hpp"
#include "pool_cpp/logging.hpp"

using namespace pool_cpp;
using namespace std::chrono_literals;

namespace {

    TEST(ConfigTest, EmptyOptionsKeepDefaults) {
        auto r = PoolConfiguration::from_options({});
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value().size, 5u);
        EXPECT_EQ(r.value().timeout, 5s);
    }

    TEST(ConfigTest, OptionsMergeOverDefaults) {
        auto r = PoolConfiguration::from_options({{"size", "12"}});
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().size, 12u);
        EXPECT_EQ(r.value().timeout, 5s);
    }

    TEST(ConfigTest, OptionsMergeOverGivenBase) {
        PoolConfiguration base;
        base.size = 3;
        base.timeout = 100ms;
        auto r = PoolConfiguration::from_options({{"timeout", "2"}}, base);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().size, 3u);
        EXPECT_EQ(r.value().timeout, 2s);
    }

    TEST(ConfigTest, TimeoutAcceptsFractionsAndUnits) {
        EXPECT_EQ(parse_timeout("0.5").value(), 500ms);
        EXPECT_EQ(parse_timeout("250ms").value(), 250ms);
        EXPECT_EQ(parse_timeout("3s").value(), 3s);
        EXPECT_EQ(parse_timeout(" 1.25 s ").value(), 1250ms);
        EXPECT_EQ(parse_timeout("0").value(), 0ms);
    }

    TEST(ConfigTest, TimeoutRejectsGarbage) {
        EXPECT_TRUE(parse_timeout("").is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(parse_timeout("soon").is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(parse_timeout("5m").is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(parse_timeout("-1").is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(parse_timeout("inf").is(Error::Code::InvalidConfiguration));
    }

    TEST(ConfigTest, TimeoutBeyondClockRangeIsTooLarge) {
        auto r = parse_timeout("1e30");
        ASSERT_TRUE(r.is(Error::Code::InvalidConfiguration));
        EXPECT_NE(r.error().message.find("too large"), std::string::npos);

        EXPECT_TRUE(parse_timeout("1e16").is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(parse_timeout("1e19ms").is(Error::Code::InvalidConfiguration));
        EXPECT_EQ(parse_timeout("1e12").value(),
                  std::chrono::milliseconds(1000000000000000LL));

        auto opts = PoolConfiguration::from_options({{"timeout", "1e30"}});
        ASSERT_TRUE(opts.has_error());
        EXPECT_NE(opts.error().message.find("too large"), std::string::npos);
    }

    TEST(ConfigTest, SizeMustBePositiveInteger) {
        EXPECT_TRUE(PoolConfiguration::from_options({{"size", "0"}})
                        .is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(PoolConfiguration::from_options({{"size", "-3"}})
                        .is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(PoolConfiguration::from_options({{"size", "2.5"}})
                        .is(Error::Code::InvalidConfiguration));
        EXPECT_TRUE(PoolConfiguration::from_options({{"size", ""}})
                        .is(Error::Code::InvalidConfiguration));
    }

    TEST(ConfigTest, UnknownOptionIsRejected) {
        auto r = PoolConfiguration::from_options({{"max_idle", "3"}});
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::InvalidConfiguration);
        EXPECT_NE(r.error().message.find("max_idle"), std::string::npos);
    }

    TEST(ConfigTest, ValidateRejectsNegativeTimeout) {
        PoolConfiguration cfg;
        cfg.timeout = -1ms;
        EXPECT_TRUE(validate(cfg).is(Error::Code::InvalidConfiguration));
    }

    TEST(ConfigTest, ValidateAcceptsZeroTimeout) {
        PoolConfiguration cfg;
        cfg.timeout = 0ms;
        EXPECT_TRUE(validate(cfg).has_value());
    }

    TEST(LoggingTest, MakeLoggerAppliesLevel) {
        auto log = make_logger("pool-test", "debug");
        ASSERT_TRUE(log);
        EXPECT_EQ(log->name(), "pool-test");
        EXPECT_EQ(log->level(), spdlog::level::debug);
    }

    TEST(LoggingTest, UnknownLevelFallsBackToInfo) {
        EXPECT_EQ(make_logger("a", "chatty")->level(), spdlog::level::info);
        EXPECT_EQ(make_logger("b", "off")->level(), spdlog::level::off);
    }

}  // namespace
