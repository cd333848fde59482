/**
 * @file Wavelet.hpp
 * @brief Daubechies discrete wavelet decomposition.
 * @author MasterLaplace
 *
 * Supports the orthogonal Daubechies family "haar"/"db1" through "db4".
 * Single-level transforms use half-sample symmetric boundary extension,
 * giving floor((n + F - 1) / 2) coefficients per band for a filter of
 * length F.
 *
 * @code
 *   auto wavelet = Wavelet::byName("db2");
 *   auto coeffs = wavelet->decompose(signal, 3);  // [cA3, cD3, cD2, cD1]
 * @endcode
 */

#pragma once

#ifndef PHYTO_MATH_WAVELET_HPP
    #define PHYTO_MATH_WAVELET_HPP

#include <phyto/core/Error.hpp>
#include <phyto/core/Types.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phyto::math {

/**
 * @brief Approximation and detail coefficients of one decomposition level.
 */
struct DwtLevel {
    std::vector<double> approximation;
    std::vector<double> detail;
};

/**
 * @brief An orthogonal wavelet defined by its decomposition filters.
 */
class Wavelet {
public:
    /**
     * @brief Looks up a wavelet by name ("haar", "db1" ... "db4").
     * @return kInvalidArgument for an unknown name
     */
    [[nodiscard]] static core::Expected<Wavelet> byName(std::string_view name);

    [[nodiscard]] const std::string &name() const noexcept { return _name; }
    [[nodiscard]] core::usize filterLength() const noexcept { return _decLo.size(); }

    /**
     * @brief Deepest useful decomposition level for a signal of length @p n.
     */
    [[nodiscard]] core::usize maxLevel(core::usize n) const noexcept;

    /**
     * @brief Single-level transform.
     */
    [[nodiscard]] DwtLevel dwt(std::span<const double> x) const;

    /**
     * @brief Multilevel decomposition.
     *
     * @param x     Input signal
     * @param level Decomposition depth L (>= 1)
     * Levels past maxLevel(x.size()) are still computed.
     *
     * @return L + 1 arrays ordered [cA_L, cD_L, cD_L-1, ..., cD_1], or
     *         kEmptyInput for an empty signal
     */
    [[nodiscard]] core::Expected<std::vector<std::vector<double>>> decompose(
        std::span<const double> x, core::usize level) const;

private:
    Wavelet(std::string name, std::vector<double> decLo);

    std::string _name;
    std::vector<double> _decLo;
    std::vector<double> _decHi;
};

} // namespace phyto::math

#endif // PHYTO_MATH_WAVELET_HPP
