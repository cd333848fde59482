/**
 * @file Types.hpp
 * @brief Fixed-width aliases used across the Phyto modules.
 *
 * Sizes and reading indices are usize, signed offsets (which may count
 * from the end of a segment) are i64.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_CORE_TYPES_HPP
    #define PHYTO_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace phyto::core {

using u8    = std::uint8_t;
using u16   = std::uint16_t;
using u32   = std::uint32_t;
using i64   = std::int64_t;
using f64   = double;
using usize = std::size_t;
using isize = std::ptrdiff_t;

} // namespace phyto::core

#endif // PHYTO_CORE_TYPES_HPP
