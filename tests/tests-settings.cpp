#include <log.hpp>
#include <settings.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using cmdguard::LogLevel;
using cmdguard::Settings;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using strings = std::vector<std::string>;

auto parse(std::string const& source, strings& warnings) -> Settings
{
    return cmdguard::parse_settings(source, "test.toml", warnings);
}

auto parse_error(std::string const& source) -> std::string
{
    strings warnings;
    try
    {
        parse(source, warnings);
    }
    catch (std::runtime_error const& err)
    {
        return err.what();
    }
    return "";
}

TEST(Settings, Defaults)
{
    Settings const settings;
    EXPECT_EQ(settings.timeout, 30s);
    EXPECT_EQ(settings.kill_grace, 5s);
    EXPECT_EQ(settings.max_retries, 3);
    EXPECT_EQ(settings.retry_delay, 1s);
    EXPECT_EQ(settings.max_total_retry_time, 300s);
    EXPECT_EQ(settings.circuit_threshold, 5);
    EXPECT_EQ(settings.circuit_cooldown, 60s);
    EXPECT_FALSE(settings.logging_enabled);
    EXPECT_EQ(settings.log_level, LogLevel::Error);
    EXPECT_EQ(settings.retryable.patterns(), cmdguard::RetryClassifier::default_patterns());
}

TEST(Settings, EmptyDocumentKeepsDefaults)
{
    strings warnings;
    auto const settings = parse("", warnings);
    EXPECT_THAT(warnings, IsEmpty());
    EXPECT_EQ(settings.timeout, 30s);
    EXPECT_EQ(settings.max_retries, 3);
}

TEST(Settings, ParsesEverySection)
{
    strings warnings;
    auto const settings = parse(R"(
[execution]
timeout_ms = 45000
kill_grace_ms = 1000

[retry]
max_retries = 5
delay_ms = 250
max_total_ms = 10000
retryable_patterns = ["quota", "overloaded"]

[circuit_breaker]
threshold = 3
cooldown_ms = 5000

[logging]
enabled = true
level = "debug"
)", warnings);

    EXPECT_THAT(warnings, IsEmpty());
    EXPECT_EQ(settings.timeout, 45s);
    EXPECT_EQ(settings.kill_grace, 1s);
    EXPECT_EQ(settings.max_retries, 5);
    EXPECT_EQ(settings.retry_delay, 250ms);
    EXPECT_EQ(settings.max_total_retry_time, 10s);
    EXPECT_EQ(settings.retryable.patterns(), (strings{"quota", "overloaded"}));
    EXPECT_TRUE(settings.retryable.retryable("Model OVERLOADED"));
    EXPECT_FALSE(settings.retryable.retryable("network down"));
    EXPECT_EQ(settings.circuit_threshold, 3);
    EXPECT_EQ(settings.circuit_cooldown, 5s);
    EXPECT_TRUE(settings.logging_enabled);
    EXPECT_EQ(settings.log_level, LogLevel::Debug);
}

TEST(Settings, ClampsOutOfRangeValues)
{
    strings warnings;
    auto const settings = parse(R"(
[execution]
timeout_ms = 100

[retry]
max_retries = 50
delay_ms = 10
)", warnings);

    EXPECT_EQ(settings.timeout, 5s);
    EXPECT_EQ(settings.max_retries, 10);
    EXPECT_EQ(settings.retry_delay, 100ms);
    EXPECT_THAT(warnings, ElementsAre(
        "execution.timeout_ms must be between 5000 and 600000, using 5000",
        "retry.max_retries must be between 1 and 10, using 10",
        "retry.delay_ms must be between 100 and 30000, using 100"
    ));
}

TEST(Settings, ClampsUpperTimeout)
{
    strings warnings;
    auto const settings = parse("[execution]\ntimeout_ms = 9999999\n", warnings);
    EXPECT_EQ(settings.timeout, 600s);
    EXPECT_THAT(warnings, ElementsAre("execution.timeout_ms must be between 5000 and 600000, using 600000"));
}

TEST(Settings, ValidateLeavesGoodValuesAlone)
{
    Settings settings;
    EXPECT_THAT(cmdguard::validate_settings(settings), IsEmpty());

    settings.max_retries = 0;
    EXPECT_THAT(cmdguard::validate_settings(settings),
        ElementsAre("retry.max_retries must be between 1 and 10, using 1"));
    EXPECT_EQ(settings.max_retries, 1);
}

TEST(Settings, WrongTypeIsAnError)
{
    EXPECT_EQ(parse_error("[execution]\ntimeout_ms = \"fast\"\n"),
              "test.toml: execution.timeout_ms must be an integer");
    EXPECT_EQ(parse_error("[logging]\nenabled = 1\n"),
              "test.toml: logging.enabled must be a boolean");
    EXPECT_EQ(parse_error("[retry]\nretryable_patterns = [\"a\", 2]\n"),
              "test.toml: retry.retryable_patterns must be an array of strings");
    EXPECT_EQ(parse_error("execution = 5\n"),
              "test.toml: execution must be a table");
}

TEST(Settings, SyntaxErrorIsAnError)
{
    EXPECT_THAT(parse_error("[execution\ntimeout_ms = \n"), HasSubstr("test.toml: "));
}

TEST(Settings, InvalidPatternIsAnError)
{
    EXPECT_THAT(parse_error("[retry]\nretryable_patterns = [\"(\"]\n"),
                HasSubstr("test.toml: retry.retryable_patterns: "));
}

TEST(Settings, UnknownLogLevelFallsBackToError)
{
    strings warnings;
    auto const settings = parse("[logging]\nenabled = true\nlevel = \"chatty\"\n", warnings);
    EXPECT_EQ(settings.log_level, LogLevel::Error);
    EXPECT_THAT(warnings, ElementsAre("logging.level must be one of error, warn, info, debug, using error"));
}

TEST(Settings, MissingFileIsAnError)
{
    strings warnings;
    EXPECT_THROW(cmdguard::load_settings("/cmdguard/nonexistent/settings.toml", warnings), std::runtime_error);
}

TEST(Settings, LoadsFromFile)
{
    auto const path = testing::TempDir() + "cmdguard-settings.toml";
    {
        std::ofstream out{path};
        out << "[retry]\nmax_retries = 7\n";
    }

    strings warnings;
    auto const settings = cmdguard::load_settings(path, warnings);
    std::remove(path.c_str());

    EXPECT_EQ(settings.max_retries, 7);
    EXPECT_THAT(warnings, IsEmpty());
}

TEST(Logger, ErrorsAlwaysWritten)
{
    std::ostringstream sink;
    cmdguard::Logger log{sink};
    log.info("test", "hidden");
    log.error("test", "shown ", 42);
    EXPECT_EQ(sink.str(), "error in test: shown 42\n");
}

TEST(Logger, ThresholdFiltersLevels)
{
    std::ostringstream sink;
    cmdguard::Logger log{sink};

    Settings settings;
    settings.logging_enabled = true;
    settings.log_level = LogLevel::Warn;
    cmdguard::configure_logger(log, settings);

    log.debug("test", "hidden");
    log.info("test", "hidden");
    log.warn("test", "careful");
    EXPECT_EQ(sink.str(), "warn in test: careful\n");
}

TEST(Logger, ParsesLevelNames)
{
    EXPECT_EQ(cmdguard::parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(cmdguard::parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(cmdguard::parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(cmdguard::parse_log_level("debug"), LogLevel::Debug);
    EXPECT_FALSE(cmdguard::parse_log_level("verbose"));
}

} // namespace

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
