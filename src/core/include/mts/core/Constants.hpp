/**
 * @file Constants.hpp
 * @brief Compile-time defaults for the strike-statistics engine.
 *
 * All tunable parameters that affect alignment, folding, and histogram
 * construction are centralised here so that a single header controls the
 * engine's default operating parameters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_CORE_CONSTANTS_HPP
    #define MTS_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace mts::core {

inline constexpr f64   kDefaultPeriodTolerance = 0.05;
inline constexpr f64   kDefaultBinWidthDeg     = 5.0;

inline constexpr f64   kFoldedDomainLow        = -90.0;
inline constexpr f64   kFoldedDomainHigh       = 90.0;
inline constexpr f64   kUnfoldedDomainLow      = 0.0;
inline constexpr f64   kUnfoldedDomainHigh     = 360.0;

inline constexpr f64   kStrikeOffsetDeg        = 90.0;
inline constexpr f64   kExponentSnapEps        = 1e-9;
inline constexpr f64   kResultantEps           = 1e-12;
inline constexpr f64   kBinCountEps            = 1e-9;

inline constexpr usize kEstimatorCount         = 3;

// Explicit decade ranges, log10(period) in seconds.
inline constexpr i32   kMinDecadeExponent      = -30;
inline constexpr i32   kMaxDecadeExponent      = 30;

} // namespace mts::core

#endif // MTS_CORE_CONSTANTS_HPP
