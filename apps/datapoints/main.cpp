// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief phyto-datapoints entry-point.
///
/// Reads a recording (electrode readings + stimulus marks), splits it into
/// one recording per plant and writes the labelled datapoints CSV, each
/// row tagged with its plant.
// /////////////////////////////////////////////////////////////////////////////

#include <phyto/core/Constants.hpp>
#include <phyto/core/Log.hpp>
#include <phyto/core/Parse.hpp>
#include <phyto/data/CsvIo.hpp>
#include <phyto/data/Datapoint.hpp>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using phyto::core::ErrorCode;
using phyto::core::Expected;
using phyto::core::makeError;

struct Options {
    std::string readingsPath;
    std::string marksPath;
    std::string outPath;
    std::string name;
    phyto::core::usize preStimulus = phyto::core::kDefaultPreStimulus;
    phyto::core::usize windowOffset = phyto::core::kDefaultWindowOffset;
    double sampleFreq = 1.0;
    bool includeNull = false;
    std::optional<phyto::core::LogLevel> logLevel;
};

void usage()
{
    std::fprintf(stderr,
        "usage: phyto-datapoints <readings.csv> <marks.csv> <out.csv>\n"
        "                        [--pre N] [--window-offset N] [--sample-freq F]\n"
        "                        [--name NAME] [--null] [--verbose] [--log-level L]\n");
}

Expected<Options> parseArgs(int argc, char *argv[])
{
    Options opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> Expected<std::string> {
            if (i + 1 >= argc)
                return makeError(ErrorCode::kInvalidArgument, std::string(arg) + " expects a value");
            return std::string(argv[++i]);
        };

        if (arg == "--pre") {
            const auto text = PHYTO_TRY(value());
            opts.preStimulus = PHYTO_TRY(phyto::core::parseCount(arg, text));
        } else if (arg == "--window-offset") {
            const auto text = PHYTO_TRY(value());
            opts.windowOffset = PHYTO_TRY(phyto::core::parseCount(arg, text));
        } else if (arg == "--sample-freq") {
            const auto text = PHYTO_TRY(value());
            opts.sampleFreq = PHYTO_TRY(phyto::core::parseReal(arg, text));
        } else if (arg == "--name") {
            opts.name = PHYTO_TRY(value());
        } else if (arg == "--null") {
            opts.includeNull = true;
        } else if (arg == "--verbose") {
            opts.logLevel = phyto::core::LogLevel::kDebug;
        } else if (arg == "--log-level") {
            const auto text = PHYTO_TRY(value());
            opts.logLevel = phyto::core::parseLogLevel(text);
            if (!opts.logLevel)
                return makeError(ErrorCode::kInvalidArgument, "unknown log level '" + text + "'");
        } else if (arg.starts_with("--")) {
            return makeError(ErrorCode::kInvalidArgument, "unknown option " + std::string(arg));
        } else {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() != 3)
        return makeError(ErrorCode::kInvalidArgument, "expected 3 paths, got " + std::to_string(positional.size()));

    opts.readingsPath = positional[0];
    opts.marksPath = positional[1];
    opts.outPath = positional[2];
    if (opts.name.empty())
        opts.name = std::filesystem::path(opts.readingsPath).stem().string();
    return opts;
}

phyto::core::ExpectedVoid run(const Options &opts)
{
    using namespace phyto;

    const auto config = PHYTO_TRY(data::DatapointConfig::Builder{}
        .preStimulus(opts.preStimulus)
        .windowOffset(opts.windowOffset)
        .includeNull(opts.includeNull)
        .build());

    const auto plants = PHYTO_TRY(data::loadRecording(
        opts.readingsPath, opts.marksPath, opts.name, opts.sampleFreq, data::StimulusCatalog::defaults()));

    const auto datapoints = data::generateAll(plants, config);
    core::Log::info("app", std::to_string(plants.size()) + " plants, " + std::to_string(datapoints.size()) + " datapoints");

    for (const auto &[label, samples] : data::groupTypes(datapoints.batch))
        core::Log::info("app", "  " + label + ": " + std::to_string(samples.size()));

    PHYTO_TRY_VOID(data::saveDatapoints(opts.outPath, datapoints));
    core::Log::info("app", "wrote " + opts.outPath);
    return {};
}

} // namespace

int main(int argc, char *argv[])
{
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        phyto::core::Log::error("app", opts.error().format());
        usage();
        return 2;
    }

    if (opts->logLevel)
        phyto::core::Log::setMinLevel(*opts->logLevel);

    auto result = run(*opts);
    if (!result) {
        phyto::core::Log::error("app", result.error().format());
        return 1;
    }
    return 0;
}
