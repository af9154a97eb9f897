/**
 * @file Types.hpp
 * @brief Scalar aliases used across the core, strike and io modules.
 *
 * Angles and periods are f64 throughout; decade exponents are i32; grid,
 * station and bin indices are usize.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_CORE_TYPES_HPP
    #define MTS_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace mts::core {

using u8    = std::uint8_t;
using u16   = std::uint16_t;
using i32   = std::int32_t;
using f64   = double;
using usize = std::size_t;

} // namespace mts::core

#endif // MTS_CORE_TYPES_HPP
