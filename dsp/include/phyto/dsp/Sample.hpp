/**
 * @file Sample.hpp
 * @brief Value type flowing through every transform.
 * @author MasterLaplace
 *
 * A Sample is one of three payload kinds:
 *  - real:     time x channel matrix (a 1-D signal is a single column)
 *  - complex:  frequency x channel matrix produced by Fourier
 *  - segments: ordered list of real matrices of possibly different lengths,
 *              e.g. separate wavelet bands or un-mapped Split chunks
 *
 * Memory layout follows Eigen's column-major default, so each channel is a
 * contiguous column that can be viewed as a std::span<const double>.
 */

#pragma once

#ifndef PHYTO_DSP_SAMPLE_HPP
    #define PHYTO_DSP_SAMPLE_HPP

#include <phyto/core/Error.hpp>
#include <phyto/core/Types.hpp>

#include <Eigen/Dense>

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace phyto::dsp {

using RealMatrix    = Eigen::MatrixXd;
using ComplexMatrix = Eigen::MatrixXcd;
using SegmentList   = std::vector<RealMatrix>;

enum class SampleKind : core::u8 {
    kReal,
    kComplex,
    kSegments
};

[[nodiscard]] constexpr std::string_view sampleKindName(SampleKind kind) noexcept
{
    switch (kind) {
        case SampleKind::kReal:     return "real";
        case SampleKind::kComplex:  return "complex";
        case SampleKind::kSegments: return "segments";
    }
    return "unknown";
}

class Sample {
public:
    Sample() = default;
    Sample(RealMatrix values) : _payload(std::move(values)) {}
    Sample(ComplexMatrix values) : _payload(std::move(values)) {}
    Sample(SegmentList segments) : _payload(std::move(segments)) {}

    /**
     * @brief Builds a single-channel sample from a sequence.
     */
    [[nodiscard]] static Sample fromVector(std::span<const double> values);

    /**
     * @brief Builds a multi-channel sample from rows of per-channel values.
     */
    [[nodiscard]] static core::Expected<Sample> fromRows(
        const std::vector<std::vector<double>> &rows);

    [[nodiscard]] SampleKind kind() const noexcept
    {
        return static_cast<SampleKind>(_payload.index());
    }

    [[nodiscard]] bool isReal() const noexcept { return kind() == SampleKind::kReal; }
    [[nodiscard]] bool isComplex() const noexcept { return kind() == SampleKind::kComplex; }
    [[nodiscard]] bool isSegments() const noexcept { return kind() == SampleKind::kSegments; }

    /// Precondition: isReal().
    [[nodiscard]] const RealMatrix &real() const { return std::get<RealMatrix>(_payload); }
    [[nodiscard]] RealMatrix &real() { return std::get<RealMatrix>(_payload); }

    /// Precondition: isComplex().
    [[nodiscard]] const ComplexMatrix &complex() const { return std::get<ComplexMatrix>(_payload); }

    /// Precondition: isSegments().
    [[nodiscard]] const SegmentList &segments() const { return std::get<SegmentList>(_payload); }

    /**
     * @brief Number of time points (rows); for segments, the sum over segments.
     */
    [[nodiscard]] core::usize length() const noexcept;

    /**
     * @brief Number of channels (columns); for segments, the first segment's.
     */
    [[nodiscard]] core::usize channelCount() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return length() == 0; }

    /**
     * @brief Same kind, length and channel count (and segment layout).
     */
    [[nodiscard]] bool sameShape(const Sample &other) const noexcept;

    /**
     * @brief Short description such as "real[200x2]", used in error messages.
     */
    [[nodiscard]] std::string shapeString() const;

    /**
     * @brief Column-major copy of every real value (segments in order).
     */
    [[nodiscard]] core::Expected<Eigen::VectorXd> flatten() const;

private:
    std::variant<RealMatrix, ComplexMatrix, SegmentList> _payload;
};

using Batch  = std::vector<Sample>;
using Labels = std::vector<std::string>;

/**
 * @brief Views one channel of a real matrix as a contiguous span.
 */
[[nodiscard]] inline std::span<const double> channelSpan(const RealMatrix &m, Eigen::Index ch)
{
    return {m.col(ch).data(), static_cast<core::usize>(m.rows())};
}

/**
 * @brief Fails with kShapeMismatch unless @p sample holds a real payload.
 */
[[nodiscard]] core::ExpectedVoid expectReal(const Sample &sample, std::string_view stage);

/**
 * @brief Concatenates samples along the time axis.
 *
 * Real parts must share their channel count, complex parts likewise;
 * segment parts are flattened channel by channel into a single column.
 * Mixed kinds are rejected.
 */
[[nodiscard]] core::Expected<Sample> concatenate(std::span<const Sample> parts, std::string_view stage);

} // namespace phyto::dsp

#endif // PHYTO_DSP_SAMPLE_HPP
