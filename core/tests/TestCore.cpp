/**
 * @file TestCore.cpp
 * @brief Unit tests for Error, Expected propagation, Log and option parsing.
 */

#include <catch2/catch_test_macros.hpp>

#include "phyto/core/Error.hpp"
#include "phyto/core/Log.hpp"
#include "phyto/core/Parse.hpp"

#include <string>
#include <vector>

namespace phyto::core {

namespace {

Expected<int> half(int value)
{
    if (value % 2 != 0)
        return makeError(ErrorCode::kInvalidArgument, "odd value " + std::to_string(value));
    return value / 2;
}

Expected<int> quarter(int value)
{
    const int h = PHYTO_TRY(half(value));
    return PHYTO_TRY(half(h));
}

ExpectedVoid requireEven(int value)
{
    PHYTO_TRY_VOID(half(value));
    return {};
}

class CapturingLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        lines.push_back(std::to_string(static_cast<int>(level)) + "|" + std::string(tag) + "|" + std::string(message));
    }

    std::vector<std::string> lines;
};

} // namespace

TEST_CASE("Error carries code, category and location", "[core][error]")
{
    const Error err(ErrorCode::kFileNotFound, "missing.csv");
    REQUIRE(err.code() == ErrorCode::kFileNotFound);
    REQUIRE(err.category() == ErrorCategory::kIo);
    REQUIRE(err.message() == "missing.csv");

    const auto text = err.format();
    REQUIRE(text.starts_with("[FileNotFound] missing.csv ("));
    REQUIRE(text.find("TestCore.cpp") != std::string::npos);
}

TEST_CASE("Error codes map onto categories", "[core][error]")
{
    REQUIRE(errorCategory(ErrorCode::kInvalidArgument) == ErrorCategory::kConfiguration);
    REQUIRE(errorCategory(ErrorCode::kNotFitted) == ErrorCategory::kConfiguration);
    REQUIRE(errorCategory(ErrorCode::kChannelCountMismatch) == ErrorCategory::kShape);
    REQUIRE(errorCategory(ErrorCode::kDegenerateSignal) == ErrorCategory::kDegenerate);
    REQUIRE(errorCategory(ErrorCode::kDomainError) == ErrorCategory::kDegenerate);
    REQUIRE(errorCategory(ErrorCode::kFileParseError) == ErrorCategory::kIo);
    REQUIRE(errorCategory(ErrorCode::kInternalError) == ErrorCategory::kInternal);
}

TEST_CASE("PHYTO_TRY propagates the first error", "[core][expected]")
{
    REQUIRE(quarter(12) == 3);

    auto odd = quarter(6);
    REQUIRE_FALSE(odd.has_value());
    REQUIRE(odd.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(odd.error().message() == "odd value 3");

    REQUIRE(requireEven(4).has_value());
    REQUIRE_FALSE(requireEven(5).has_value());
}

TEST_CASE("Log filters by level and forwards tags", "[core][log]")
{
    CapturingLogger logger;
    Log::setLogger(&logger);
    const auto previous = Log::minLevel();
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("dsp", "hidden");
    Log::warn("dsp", "dropped datapoint 3");
    Log::error("data", "bad file");

    Log::setMinLevel(previous);
    Log::setLogger(nullptr);

    REQUIRE(logger.lines == std::vector<std::string>{"2|dsp|dropped datapoint 3", "3|data|bad file"});
}

TEST_CASE("Log levels parse from their names", "[core][log]")
{
    REQUIRE(parseLogLevel("debug") == LogLevel::kDebug);
    REQUIRE(parseLogLevel(logLevelName(LogLevel::kError)) == LogLevel::kError);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());

    const auto previous = Log::minLevel();
    Log::setMinLevel(LogLevel::kInfo);
    REQUIRE_FALSE(Log::enabled(LogLevel::kDebug));
    REQUIRE(Log::enabled(LogLevel::kWarn));
    Log::setMinLevel(previous);
}

TEST_CASE("Option values parse strictly", "[core][parse]")
{
    SECTION("counts")
    {
        REQUIRE(parseCount("--windows", "3") == 3u);
        for (const std::string bad : {"", "-1", "3x", "2.5", " "}) {
            CAPTURE(bad);
            auto count = parseCount("--windows", bad);
            REQUIRE_FALSE(count.has_value());
            REQUIRE(count.error().code() == ErrorCode::kInvalidArgument);
        }
    }

    SECTION("integers accept a sign")
    {
        REQUIRE(parseInteger("--post-offset", "-40") == -40);
        REQUIRE_FALSE(parseInteger("--post-offset", "40abc").has_value());
    }

    SECTION("reals must be finite")
    {
        REQUIRE(parseReal("--train-fraction", "0.75") == 0.75);
        REQUIRE_FALSE(parseReal("--train-fraction", "nan").has_value());
        REQUIRE_FALSE(parseReal("--train-fraction", "0.75.1").has_value());

        auto bad = parseReal("--sample-freq", "fast");
        REQUIRE(bad.error().message() == "--sample-freq expects a finite number, got 'fast'");
    }

    SECTION("lists skip empty items")
    {
        REQUIRE(splitList("ozone,,water,") == std::vector<std::string>{"ozone", "water"});
        REQUIRE(splitList("").empty());
    }
}

} // namespace phyto::core
