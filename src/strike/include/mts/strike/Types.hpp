/**
 * @file Types.hpp
 * @brief Vocabulary types for the strike-statistics pipeline.
 * @author MasterLaplace
 *
 * Defines the types shared across the whole mts::strike namespace:
 * estimator and fold-mode enumerations, decade bins, statistics, and
 * alignment diagnostics. All types are value-semantic and trivially
 * movable.
 *
 * @see Constants.hpp for default parameter values
 * @see Error.hpp for the error handling strategy
 */

#pragma once

#ifndef MTS_STRIKE_TYPES_HPP
    #define MTS_STRIKE_TYPES_HPP

    #include <mts/core/Constants.hpp>
    #include <mts/core/Types.hpp>

    #include <array>
    #include <cmath>
    #include <limits>
    #include <optional>
    #include <string>
    #include <string_view>

namespace mts::strike {

// ─── Estimator ───────────────────────────────────────────────────────────────

/**
 * @brief The three independent strike estimates carried by a sounding.
 *
 * The underlying value doubles as the index into per-estimator arrays.
 */
enum class Estimator : core::u8 {
    kInvariant = 0,
    kPhaseTensor,
    kTipper
};

inline constexpr std::array<Estimator, core::kEstimatorCount> kAllEstimators{
    Estimator::kInvariant,
    Estimator::kPhaseTensor,
    Estimator::kTipper,
};

[[nodiscard]] constexpr core::usize estimatorIndex(Estimator e) noexcept
{
    return static_cast<core::usize>(e);
}

[[nodiscard]] constexpr std::string_view estimatorName(Estimator e) noexcept
{
    switch (e) {
        case Estimator::kInvariant:   return "invariant";
        case Estimator::kPhaseTensor: return "pt_azimuth";
        case Estimator::kTipper:      return "tipper";
    }
    return "unknown";
}

/**
 * @brief Parses "invariant", "pt"/"pt_azimuth" or "tipper".
 */
[[nodiscard]] std::optional<Estimator> parseEstimator(std::string_view name) noexcept;

// ─── Fold Mode ───────────────────────────────────────────────────────────────

/**
 * @brief Circular convention used for every angle of a run.
 *
 * kFolded maps strikes into (-90, 90], resolving the 180 degree ambiguity.
 * kUnfolded keeps the full circle [0, 360).
 */
enum class FoldMode : core::u8 {
    kFolded = 0,
    kUnfolded
};

[[nodiscard]] constexpr std::string_view foldModeName(FoldMode mode) noexcept
{
    return mode == FoldMode::kFolded ? "folded" : "unfolded";
}

/**
 * @brief Angular domain [low, high] of a fold mode, in degrees.
 */
struct AngularDomain {
    core::f64 low;
    core::f64 high;

    [[nodiscard]] constexpr core::f64 width() const noexcept { return high - low; }
};

[[nodiscard]] constexpr AngularDomain domainOf(FoldMode mode) noexcept
{
    return mode == FoldMode::kFolded
        ? AngularDomain{core::kFoldedDomainLow, core::kFoldedDomainHigh}
        : AngularDomain{core::kUnfoldedDomainLow, core::kUnfoldedDomainHigh};
}

// ─── Mean Method ─────────────────────────────────────────────────────────────

/**
 * @brief How the mean of a sample set is computed.
 *
 * kArithmetic reproduces the legacy output. kVector uses the resultant
 * vector (angle-doubled in folded mode).
 */
enum class MeanMethod : core::u8 {
    kArithmetic = 0,
    kVector
};

// ─── Decade Range ────────────────────────────────────────────────────────────

/**
 * @brief Half-open exponent range [low, high) in log10(period) space.
 */
struct DecadeRange {
    core::i32 low;
    core::i32 high;

    [[nodiscard]] constexpr core::i32 span() const noexcept { return high - low; }
    [[nodiscard]] constexpr bool operator==(const DecadeRange &) const = default;
};

// ─── Decade Bin ──────────────────────────────────────────────────────────────

/**
 * @brief One decade [b, b+1) or an aggregate range [bMin, bMax).
 */
struct DecadeBin {
    DecadeRange range;
    bool aggregate = false;

    [[nodiscard]] bool contains(core::f64 exponent) const noexcept
    {
        return exponent >= static_cast<core::f64>(range.low) &&
               exponent <  static_cast<core::f64>(range.high);
    }

    [[nodiscard]] core::f64 periodLow() const noexcept  { return std::pow(10.0, range.low); }
    [[nodiscard]] core::f64 periodHigh() const noexcept { return std::pow(10.0, range.high); }

    /**
     * @brief Human-readable label such as "0.01-0.1s".
     */
    [[nodiscard]] std::string label() const;
};

// ─── Strike Statistic ────────────────────────────────────────────────────────

inline constexpr core::f64 kUndefined = std::numeric_limits<core::f64>::quiet_NaN();

/**
 * @brief Mean, median, and mode in degrees for one sample set.
 *
 * All three angles are NaN when sampleCount is zero.
 */
struct StrikeStatistic {
    core::f64   mean   = kUndefined;
    core::f64   median = kUndefined;
    core::f64   mode   = kUndefined;
    core::usize sampleCount = 0;

    [[nodiscard]] bool defined() const noexcept { return sampleCount > 0; }
};

// ─── Alignment Diagnostics ───────────────────────────────────────────────────

/**
 * @brief Per-station, per-estimator alignment counters.
 *
 * samplesMatched counts station samples lying within tolerance of at least
 * one grid period; cellsFilled counts the grid cells the station populated.
 */
struct AlignmentDiagnostics {
    std::string stationId;
    Estimator   estimator = Estimator::kInvariant;
    core::usize samplesTotal   = 0;
    core::usize samplesMatched = 0;
    core::usize cellsFilled    = 0;

    [[nodiscard]] core::f64 matchRatio() const noexcept
    {
        return samplesTotal == 0
            ? 0.0
            : static_cast<core::f64>(samplesMatched) / static_cast<core::f64>(samplesTotal);
    }
};

} // namespace mts::strike

#endif // MTS_STRIKE_TYPES_HPP
