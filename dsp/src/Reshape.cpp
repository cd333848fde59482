/**
 * @file Reshape.cpp
 * @brief Implementation of MapChannels, Transpose and Split.
 * @author MasterLaplace
 */

#include "phyto/dsp/Reshape.hpp"

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;
using core::usize;

// ─── MapChannels ─────────────────────────────────────────────────────────────

Expected<MapChannels> MapChannels::create(InnerOp inner)
{
    PHYTO_TRY_VOID(expectValid(inner, "MapChannels"));
    return MapChannels(std::move(inner));
}

Expected<Sample> MapChannels::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    const RealMatrix &x = input.real();

    std::vector<RealMatrix> columns;
    columns.reserve(static_cast<usize>(x.cols()));
    Eigen::Index totalCols = 0;

    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        Sample result = PHYTO_TRY(_inner(Sample(RealMatrix(x.col(ch)))));
        if (!result.isReal()) {
            return makeError(ErrorCode::kShapeMismatch,
                "MapChannels inner operation " + std::string(_inner.name())
                + " returned " + result.shapeString());
        }
        if (!columns.empty() && result.real().rows() != columns.front().rows()) {
            return makeError(ErrorCode::kShapeMismatch,
                "MapChannels channel " + std::to_string(ch) + " yields " + result.shapeString()
                + " but channel 0 yields " + std::to_string(columns.front().rows()) + " rows");
        }
        totalCols += result.real().cols();
        columns.push_back(std::move(result.real()));
    }

    if (columns.empty())
        return makeError(ErrorCode::kEmptyInput, "MapChannels on a sample without channels");

    RealMatrix out(columns.front().rows(), totalCols);
    Eigen::Index offset = 0;
    for (const auto &c : columns) {
        out.middleCols(offset, c.cols()) = c;
        offset += c.cols();
    }
    return Sample(std::move(out));
}

// ─── Transpose ───────────────────────────────────────────────────────────────

Expected<Transpose> Transpose::create()
{
    return Transpose{};
}

Expected<Sample> Transpose::extract(const Sample &input) const
{
    if (input.isReal())
        return Sample(RealMatrix(input.real().transpose()));
    if (input.isComplex())
        return Sample(ComplexMatrix(input.complex().transpose()));
    return makeError(ErrorCode::kShapeMismatch, "Transpose cannot swap axes of " + input.shapeString());
}

// ─── Split ───────────────────────────────────────────────────────────────────

Expected<Split> Split::create(std::optional<usize> steps, std::optional<usize> divs, std::optional<InnerOp> inner)
{
    if (steps.has_value() == divs.has_value())
        return makeError(ErrorCode::kInvalidArgument, "Split requires exactly one of steps and divs");
    if (steps.value_or(1) == 0 || divs.value_or(1) == 0)
        return makeError(ErrorCode::kInvalidArgument, "Split steps and divs must be positive");
    if (inner)
        PHYTO_TRY_VOID(expectValid(*inner, "Split"));
    return Split(steps, divs, std::move(inner));
}

Expected<usize> Split::chunkLength(usize length) const
{
    const usize divisor = _steps ? *_steps : *_divs;
    if (length == 0 || length % divisor != 0) {
        return makeError(ErrorCode::kShapeMismatch,
            "Split cannot divide " + std::to_string(length) + " points evenly by "
            + std::to_string(divisor));
    }
    return _steps ? *_steps : length / *_divs;
}

Expected<Sample> Split::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    const usize chunk = PHYTO_TRY(chunkLength(input.length()));
    const RealMatrix &x = input.real();
    const auto rows = static_cast<Eigen::Index>(chunk);

    SegmentList chunks;
    for (Eigen::Index start = 0; start < x.rows(); start += rows)
        chunks.emplace_back(x.middleRows(start, rows));

    if (!_inner)
        return Sample(std::move(chunks));

    std::vector<Sample> results;
    results.reserve(chunks.size());
    for (auto &c : chunks)
        results.push_back(PHYTO_TRY((*_inner)(Sample(std::move(c)))));
    return concatenate(results, name());
}

} // namespace phyto::dsp
