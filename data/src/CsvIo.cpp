/**
 * @file CsvIo.cpp
 * @brief CSV readers and writers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/data/CsvIo.hpp>

#include <phyto/core/Log.hpp>

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace phyto::data {

using core::ErrorCode;
using core::makeError;
using core::usize;

namespace {

bool skipLine(const std::string &line)
{
    return line.empty() || line[0] == '#' || line == "\r";
}

std::string trim(const std::string &token)
{
    const auto first = token.find_first_not_of(" \t\r\"");
    if (first == std::string::npos)
        return {};
    const auto last = token.find_last_not_of(" \t\r\"");
    return token.substr(first, last - first + 1);
}

std::vector<std::string> splitFields(const std::string &line, char delimiter)
{
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, delimiter))
        fields.push_back(trim(token));
    return fields;
}

core::Expected<double> parseValue(const std::string &token, const std::string &path, usize lineNo)
{
    try {
        return std::stod(token);
    } catch (const std::exception &) {
        return makeError(ErrorCode::kFileParseError,
            "Invalid value '" + token + "' at line " + std::to_string(lineNo) + " of " + path);
    }
}

// 2^53, past it a double no longer holds every integer
constexpr double kMaxMarkIndex = 9007199254740992.0;

core::Expected<std::ofstream> openForWrite(const std::string &path)
{
    std::ofstream file(path);
    if (!file.is_open())
        return makeError(ErrorCode::kIoError, "cannot write " + path);
    file.precision(std::numeric_limits<double>::max_digits10);
    return file;
}

} // namespace

core::Expected<dsp::RealMatrix> loadReadings(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return makeError(ErrorCode::kFileNotFound, path);

    std::vector<std::vector<double>> rows;
    std::string line;
    usize lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        if (skipLine(line))
            continue;

        const char delimiter = (line.find('\t') != std::string::npos) ? '\t' : ',';
        std::vector<double> row;
        for (const auto &token : splitFields(line, delimiter)) {
            if (token.empty())
                continue;
            row.push_back(PHYTO_TRY(parseValue(token, path, lineNo)));
        }
        if (row.empty())
            continue;
        if (!rows.empty() && row.size() != rows.front().size()) {
            return makeError(ErrorCode::kFileParseError,
                path + ": line " + std::to_string(lineNo) + " has " + std::to_string(row.size())
                + " readings, expected " + std::to_string(rows.front().size()));
        }
        rows.push_back(std::move(row));
    }

    if (rows.empty())
        return makeError(ErrorCode::kFileParseError, path + ": no readings");

    dsp::RealMatrix readings(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(rows.front().size()));
    for (usize t = 0; t < rows.size(); ++t) {
        for (usize c = 0; c < rows[t].size(); ++c)
            readings(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(c)) = rows[t][c];
    }

    core::Log::debug("data", path + ": " + std::to_string(readings.rows()) + " readings x "
        + std::to_string(readings.cols()) + " electrodes");
    return readings;
}

core::Expected<std::vector<RawMark>> loadMarks(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return makeError(ErrorCode::kFileNotFound, path);

    std::vector<RawMark> marks;
    std::string line;
    usize lineNo = 0;
    bool header = true;

    while (std::getline(file, line)) {
        ++lineNo;
        if (skipLine(line))
            continue;
        if (header) {
            header = false;
            continue;
        }

        const auto fields = splitFields(line, ',');
        if (fields.size() < 3) {
            return makeError(ErrorCode::kFileParseError,
                path + ": line " + std::to_string(lineNo) + " needs name, time and index");
        }

        const double index = PHYTO_TRY(parseValue(fields[2], path, lineNo));
        if (!std::isfinite(index) || index < 0.0 || index >= kMaxMarkIndex) {
            return makeError(ErrorCode::kInvalidArgument,
                path + ": index '" + fields[2] + "' at line " + std::to_string(lineNo) + " is not a reading index");
        }
        marks.push_back(RawMark{fields[0], static_cast<usize>(index)});
    }
    return marks;
}

core::Expected<std::vector<Recording>> loadRecording(
    const std::string &readingsPath,
    const std::string &marksPath,
    const std::string &name,
    double sampleFreq,
    const StimulusCatalog &catalog)
{
    const auto readings = PHYTO_TRY(loadReadings(readingsPath));
    const auto marks = PHYTO_TRY(loadMarks(marksPath));

    const auto length = static_cast<usize>(readings.rows());
    for (const auto &mark : marks) {
        if (mark.index > length) {
            return makeError(ErrorCode::kInvalidArgument,
                marksPath + ": mark '" + mark.name + "' at " + std::to_string(mark.index)
                + " is past the " + std::to_string(length) + " readings of " + readingsPath);
        }
    }

    auto stimuli = catalog.resolveAll(marks);
    core::Log::info("data", name + ": " + std::to_string(stimuli.size()) + " of "
        + std::to_string(marks.size()) + " marks recognised");

    return pairElectrodes(name, readings, stimuli, sampleFreq);
}

core::Expected<PlantDatapoints> loadDatapoints(const std::string &path, usize channels)
{
    if (channels == 0)
        return makeError(ErrorCode::kInvalidArgument, "channel count must be positive");

    std::ifstream file(path);
    if (!file.is_open())
        return makeError(ErrorCode::kFileNotFound, path);

    PlantDatapoints datapoints;
    std::string line;
    usize lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        if (skipLine(line))
            continue;

        const auto fields = splitFields(line, ',');
        if (fields.size() < 3) {
            return makeError(ErrorCode::kFileParseError,
                path + ": line " + std::to_string(lineNo) + " needs plant, label and values");
        }

        std::vector<double> values;
        values.reserve(fields.size());
        for (usize i = 2; i < fields.size(); ++i) {
            if (fields[i].empty())
                continue;
            values.push_back(PHYTO_TRY(parseValue(fields[i], path, lineNo)));
        }

        if (values.empty() || values.size() % channels != 0) {
            return makeError(ErrorCode::kFileParseError,
                path + ": line " + std::to_string(lineNo) + " has " + std::to_string(values.size())
                + " values, not a multiple of " + std::to_string(channels) + " channels");
        }

        const auto length = static_cast<Eigen::Index>(values.size() / channels);
        dsp::RealMatrix m(length, static_cast<Eigen::Index>(channels));
        for (Eigen::Index t = 0; t < length; ++t) {
            for (Eigen::Index c = 0; c < m.cols(); ++c)
                m(t, c) = values[static_cast<usize>(t * m.cols() + c)];
        }

        datapoints.batch.samples.push_back(dsp::Sample(std::move(m)));
        datapoints.batch.labels.push_back(fields[1]);
        datapoints.plants.push_back(fields[0]);
    }

    core::Log::debug("data", path + ": " + std::to_string(datapoints.size()) + " datapoints");
    return datapoints;
}

core::ExpectedVoid saveDatapoints(const std::string &path, const PlantDatapoints &datapoints)
{
    const auto &batch = datapoints.batch;
    if (batch.samples.size() != batch.labels.size() || datapoints.plants.size() != batch.samples.size()) {
        return makeError(ErrorCode::kShapeMismatch,
            std::to_string(batch.samples.size()) + " samples, " + std::to_string(batch.labels.size())
            + " labels and " + std::to_string(datapoints.plants.size()) + " plant tags");
    }

    auto file = PHYTO_TRY(openForWrite(path));

    for (usize i = 0; i < batch.size(); ++i) {
        PHYTO_TRY_VOID(dsp::expectReal(batch.samples[i], "saveDatapoints"));
        const auto &m = batch.samples[i].real();

        file << datapoints.plants[i] << ',' << batch.labels[i];
        for (Eigen::Index t = 0; t < m.rows(); ++t) {
            for (Eigen::Index c = 0; c < m.cols(); ++c)
                file << ',' << m(t, c);
        }
        file << '\n';
    }

    if (!file)
        return makeError(ErrorCode::kIoError, "write failed: " + path);
    return {};
}

core::ExpectedVoid saveFeatures(const std::string &path, std::span<const FeatureTable> tables)
{
    for (const auto &table : tables) {
        if (static_cast<usize>(table.X.rows()) != table.y.size()) {
            return makeError(ErrorCode::kShapeMismatch,
                table.split + ": " + std::to_string(table.X.rows()) + " rows but "
                + std::to_string(table.y.size()) + " labels");
        }
    }

    auto file = PHYTO_TRY(openForWrite(path));

    for (const auto &table : tables) {
        for (Eigen::Index r = 0; r < table.X.rows(); ++r) {
            file << table.split << ',' << table.y[static_cast<usize>(r)];
            for (Eigen::Index c = 0; c < table.X.cols(); ++c)
                file << ',' << table.X(r, c);
            file << '\n';
        }
    }

    if (!file)
        return makeError(ErrorCode::kIoError, "write failed: " + path);
    return {};
}

} // namespace phyto::data
