/**
 * @file Parse.hpp
 * @brief Strict text-to-value conversions for command-line options.
 *
 * Every parser rejects empty text and trailing characters. @p what names
 * the value in the error message, typically the option ("--seed").
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_CORE_PARSE_HPP
    #define PHYTO_CORE_PARSE_HPP

    #include "Error.hpp"
    #include "Types.hpp"

    #include <string>
    #include <string_view>
    #include <vector>

namespace phyto::core {

/** @return kInvalidArgument unless @p text is a whole signed integer */
[[nodiscard]] Expected<i64> parseInteger(std::string_view what, const std::string &text);

/** @return kInvalidArgument unless @p text is a whole non-negative integer */
[[nodiscard]] Expected<usize> parseCount(std::string_view what, const std::string &text);

/** @return kInvalidArgument unless @p text is a finite number */
[[nodiscard]] Expected<f64> parseReal(std::string_view what, const std::string &text);

/**
 * @brief Splits "a,b,,c" into {"a", "b", "c"}.
 */
[[nodiscard]] std::vector<std::string> splitList(const std::string &text, char delimiter = ',');

} // namespace phyto::core

#endif // PHYTO_CORE_PARSE_HPP
