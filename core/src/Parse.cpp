/**
 * @file Parse.cpp
 * @brief Strict option value parsers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "phyto/core/Parse.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace phyto::core {

namespace {

std::string rejected(std::string_view what, std::string_view expected, const std::string &text)
{
    return std::string(what) + " expects " + std::string(expected) + ", got '" + text + "'";
}

} // namespace

Expected<i64> parseInteger(std::string_view what, const std::string &text)
{
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != text.size())
        return makeError(ErrorCode::kInvalidArgument, rejected(what, "an integer", text));
    return static_cast<i64>(value);
}

Expected<usize> parseCount(std::string_view what, const std::string &text)
{
    // stoull accepts "-1" and wraps it
    if (!text.empty() && text.front() == '-')
        return makeError(ErrorCode::kInvalidArgument, rejected(what, "a non-negative integer", text));

    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != text.size())
        return makeError(ErrorCode::kInvalidArgument, rejected(what, "a non-negative integer", text));
    return static_cast<usize>(value);
}

Expected<f64> parseReal(std::string_view what, const std::string &text)
{
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != text.size() || !std::isfinite(value))
        return makeError(ErrorCode::kInvalidArgument, rejected(what, "a finite number", text));
    return value;
}

std::vector<std::string> splitList(const std::string &text, char delimiter)
{
    std::vector<std::string> items;
    std::istringstream ss(text);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        if (!item.empty())
            items.push_back(item);
    }
    return items;
}

} // namespace phyto::core
