// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief phyto-extract entry-point.
///
/// Loads one or more datapoints CSVs, splits their plants into train/test,
/// filters and balances each split, fits the feature pipeline on the
/// training split only and writes the standardized features of both.
// /////////////////////////////////////////////////////////////////////////////

#include <phyto/core/Constants.hpp>
#include <phyto/core/Log.hpp>
#include <phyto/core/Parse.hpp>
#include <phyto/data/CsvIo.hpp>
#include <phyto/data/Datapoint.hpp>
#include <phyto/feature/FeatureExtractor.hpp>

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using phyto::core::ErrorCode;
using phyto::core::Expected;
using phyto::core::makeError;

struct Options {
    std::vector<std::string> datapointsPaths;
    std::string featuresPath;
    std::vector<std::string> labels;
    bool balance = false;
    double trainFraction = phyto::core::kDefaultTrainFraction;
    phyto::core::u32 seed = phyto::core::kDefaultSeed;
    phyto::feature::PipelineConfig::Builder pipeline;
    std::optional<phyto::core::LogLevel> logLevel;
};

void usage()
{
    std::fprintf(stderr,
        "usage: phyto-extract <datapoints.csv>... <features.csv>\n"
        "                     [--labels a,b,...] [--balance] [--train-fraction F] [--seed S]\n"
        "                     [--window-offset N] [--post-offset N] [--windows N] [--scales N]\n"
        "                     [--hanning] [--multiscale] [--diff] [--drop-degenerate]\n"
        "                     [--threads N] [--verbose] [--log-level L]\n"
        "Plants, not datapoints, are split between train and test.\n"
        "--scales defaults to the deepest scale whose windows still hold %zu points.\n",
        phyto::core::kEnsembleMinPoints);
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

        if (arg == "--labels") {
            opts.labels = phyto::core::splitList(PHYTO_TRY(value()));
        } else if (arg == "--balance") {
            opts.balance = true;
        } else if (arg == "--train-fraction") {
            const auto text = PHYTO_TRY(value());
            opts.trainFraction = PHYTO_TRY(phyto::core::parseReal(arg, text));
        } else if (arg == "--seed") {
            const auto text = PHYTO_TRY(value());
            opts.seed = static_cast<phyto::core::u32>(PHYTO_TRY(phyto::core::parseCount(arg, text)));
        } else if (arg == "--window-offset") {
            const auto text = PHYTO_TRY(value());
            opts.pipeline.windowOffset(PHYTO_TRY(phyto::core::parseCount(arg, text)));
        } else if (arg == "--post-offset") {
            const auto text = PHYTO_TRY(value());
            opts.pipeline.postOffset(PHYTO_TRY(phyto::core::parseInteger(arg, text)));
        } else if (arg == "--windows") {
            const auto text = PHYTO_TRY(value());
            opts.pipeline.windowCount(PHYTO_TRY(phyto::core::parseCount(arg, text)));
        } else if (arg == "--scales") {
            const auto text = PHYTO_TRY(value());
            opts.pipeline.scaleCount(PHYTO_TRY(phyto::core::parseCount(arg, text)));
        } else if (arg == "--threads") {
            const auto text = PHYTO_TRY(value());
            opts.pipeline.threads(static_cast<phyto::core::u32>(PHYTO_TRY(phyto::core::parseCount(arg, text))));
        } else if (arg == "--hanning") {
            opts.pipeline.hanning(true);
        } else if (arg == "--multiscale") {
            opts.pipeline.multiScale(true);
        } else if (arg == "--diff") {
            opts.pipeline.electrodeMode(phyto::feature::ElectrodeMode::kDifference);
        } else if (arg == "--drop-degenerate") {
            opts.pipeline.policy(phyto::dsp::DegeneratePolicy::kDrop);
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

    if (positional.size() < 2)
        return makeError(ErrorCode::kInvalidArgument, "expected at least 2 paths, got " + std::to_string(positional.size()));

    opts.featuresPath = positional.back();
    positional.pop_back();
    opts.datapointsPaths = std::move(positional);
    return opts;
}

/// Filtering and balancing run per split, after plants were assigned.
phyto::dsp::LabeledBatch prepare(const phyto::dsp::LabeledBatch &batch, const Options &opts)
{
    auto out = opts.labels.empty() ? batch : phyto::data::filterTypes(batch, opts.labels);
    if (opts.balance)
        out = phyto::data::balance(out, opts.seed);
    return out;
}

phyto::core::ExpectedVoid run(const Options &opts)
{
    using namespace phyto;

    const auto config = PHYTO_TRY(opts.pipeline.build());

    data::PlantDatapoints datapoints;
    for (const auto &path : opts.datapointsPaths)
        datapoints.append(PHYTO_TRY(data::loadDatapoints(path, core::kElectrodesPerPlant)));
    core::Log::info("app", "loaded " + std::to_string(datapoints.size()) + " datapoints");

    const auto split = PHYTO_TRY(data::splitByPlant(datapoints, opts.trainFraction, opts.seed));
    const auto train = prepare(split.train, opts);
    const auto test = prepare(split.test, opts);
    core::Log::info("app", "train " + std::to_string(train.size()) + ", test " + std::to_string(test.size()));

    if (train.size() == 0)
        return core::makeError(core::ErrorCode::kEmptyInput, "no training datapoints left to extract");

    auto extractor = PHYTO_TRY(feature::FeatureExtractor::create(config));
    const auto trainFeatures = PHYTO_TRY(extractor.fitTransform(train));

    std::vector<data::FeatureTable> tables{{"train", trainFeatures.X, trainFeatures.y}};
    std::optional<feature::FeatureSet> testFeatures;
    if (test.size() > 0) {
        testFeatures = PHYTO_TRY(extractor.transform(test));
        tables.push_back({"test", testFeatures->X, testFeatures->y});
    }

    PHYTO_TRY_VOID(data::saveFeatures(opts.featuresPath, tables));
    core::Log::info("app", "wrote " + std::to_string(trainFeatures.cols()) + " features per datapoint to " + opts.featuresPath);
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
