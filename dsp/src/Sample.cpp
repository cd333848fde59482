/**
 * @file Sample.cpp
 * @brief Implementation of the Sample value type and its helpers.
 * @author MasterLaplace
 */

#include "phyto/dsp/Sample.hpp"

#include <algorithm>
#include <sstream>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;

Sample Sample::fromVector(std::span<const double> values)
{
    RealMatrix m(static_cast<Eigen::Index>(values.size()), 1);
    std::copy(values.begin(), values.end(), m.data());
    return Sample(std::move(m));
}

Expected<Sample> Sample::fromRows(const std::vector<std::vector<double>> &rows)
{
    if (rows.empty())
        return Sample(RealMatrix(0, 0));

    const core::usize channels = rows.front().size();
    RealMatrix m(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(channels));

    for (core::usize t = 0; t < rows.size(); ++t) {
        if (rows[t].size() != channels) {
            return makeError(ErrorCode::kChannelCountMismatch,
                "row " + std::to_string(t) + " has " + std::to_string(rows[t].size())
                + " channels, expected " + std::to_string(channels));
        }
        for (core::usize ch = 0; ch < channels; ++ch)
            m(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(ch)) = rows[t][ch];
    }

    return Sample(std::move(m));
}

core::usize Sample::length() const noexcept
{
    switch (kind()) {
        case SampleKind::kReal:
            return static_cast<core::usize>(std::get<RealMatrix>(_payload).rows());
        case SampleKind::kComplex:
            return static_cast<core::usize>(std::get<ComplexMatrix>(_payload).rows());
        case SampleKind::kSegments: {
            core::usize total = 0;
            for (const auto &seg : std::get<SegmentList>(_payload))
                total += static_cast<core::usize>(seg.rows());
            return total;
        }
    }
    return 0;
}

core::usize Sample::channelCount() const noexcept
{
    switch (kind()) {
        case SampleKind::kReal:
            return static_cast<core::usize>(std::get<RealMatrix>(_payload).cols());
        case SampleKind::kComplex:
            return static_cast<core::usize>(std::get<ComplexMatrix>(_payload).cols());
        case SampleKind::kSegments: {
            const auto &segs = std::get<SegmentList>(_payload);
            return segs.empty() ? 0 : static_cast<core::usize>(segs.front().cols());
        }
    }
    return 0;
}

bool Sample::sameShape(const Sample &other) const noexcept
{
    if (kind() != other.kind())
        return false;

    if (isSegments()) {
        const auto &a = segments();
        const auto &b = other.segments();
        if (a.size() != b.size())
            return false;
        for (core::usize i = 0; i < a.size(); ++i) {
            if (a[i].rows() != b[i].rows() || a[i].cols() != b[i].cols())
                return false;
        }
        return true;
    }

    return length() == other.length() && channelCount() == other.channelCount();
}

std::string Sample::shapeString() const
{
    std::ostringstream os;
    os << sampleKindName(kind());
    if (isSegments()) {
        os << '{';
        const auto &segs = segments();
        for (core::usize i = 0; i < segs.size(); ++i)
            os << (i ? "," : "") << segs[i].rows() << 'x' << segs[i].cols();
        os << '}';
    } else {
        os << '[' << length() << 'x' << channelCount() << ']';
    }
    return os.str();
}

Expected<Eigen::VectorXd> Sample::flatten() const
{
    if (isComplex())
        return makeError(ErrorCode::kShapeMismatch, "cannot flatten a complex sample");

    if (isReal()) {
        const auto &m = real();
        return Eigen::VectorXd(Eigen::Map<const Eigen::VectorXd>(m.data(), m.size()));
    }

    Eigen::Index total = 0;
    for (const auto &seg : segments())
        total += seg.size();

    Eigen::VectorXd out(total);
    Eigen::Index offset = 0;
    for (const auto &seg : segments()) {
        out.segment(offset, seg.size()) = Eigen::Map<const Eigen::VectorXd>(seg.data(), seg.size());
        offset += seg.size();
    }
    return out;
}

core::ExpectedVoid expectReal(const Sample &sample, std::string_view stage)
{
    if (!sample.isReal()) {
        return makeError(ErrorCode::kShapeMismatch,
            std::string(stage) + " expects a real sample, got " + sample.shapeString());
    }
    return {};
}

Expected<Sample> concatenate(std::span<const Sample> parts, std::string_view stage)
{
    if (parts.empty())
        return makeError(ErrorCode::kEmptyInput, std::string(stage) + " produced no parts");

    const bool anyComplex = std::ranges::any_of(parts, &Sample::isComplex);
    const bool allComplex = std::ranges::all_of(parts, &Sample::isComplex);
    const bool anySegments = std::ranges::any_of(parts, &Sample::isSegments);

    if (anyComplex && !allComplex) {
        return makeError(ErrorCode::kShapeMismatch,
            std::string(stage) + " cannot concatenate complex with real parts");
    }

    if (allComplex) {
        const Eigen::Index cols = parts.front().complex().cols();
        Eigen::Index rows = 0;
        for (const auto &p : parts) {
            if (p.complex().cols() != cols) {
                return makeError(ErrorCode::kChannelCountMismatch,
                    std::string(stage) + " parts disagree on channel count");
            }
            rows += p.complex().rows();
        }
        ComplexMatrix out(rows, cols);
        Eigen::Index offset = 0;
        for (const auto &p : parts) {
            out.middleRows(offset, p.complex().rows()) = p.complex();
            offset += p.complex().rows();
        }
        return Sample(std::move(out));
    }

    if (anySegments) {
        std::vector<Eigen::VectorXd> columns;
        columns.reserve(parts.size());
        Eigen::Index rows = 0;
        for (const auto &p : parts) {
            columns.push_back(PHYTO_TRY(p.flatten()));
            rows += columns.back().size();
        }
        RealMatrix out(rows, 1);
        Eigen::Index offset = 0;
        for (const auto &c : columns) {
            out.col(0).segment(offset, c.size()) = c;
            offset += c.size();
        }
        return Sample(std::move(out));
    }

    const Eigen::Index cols = parts.front().real().cols();
    Eigen::Index rows = 0;
    for (const auto &p : parts) {
        if (p.real().cols() != cols) {
            return makeError(ErrorCode::kChannelCountMismatch,
                std::string(stage) + " parts disagree on channel count");
        }
        rows += p.real().rows();
    }

    RealMatrix out(rows, cols);
    Eigen::Index offset = 0;
    for (const auto &p : parts) {
        out.middleRows(offset, p.real().rows()) = p.real();
        offset += p.real().rows();
    }
    return Sample(std::move(out));
}

} // namespace phyto::dsp
