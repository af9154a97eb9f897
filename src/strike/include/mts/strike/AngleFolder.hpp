/**
 * @file AngleFolder.hpp
 * @brief Polarity conversion and circular normalisation of strike angles.
 *
 * Upstream estimators measure counter-clockwise from east. Every angle is
 * first turned clockwise from north (90 - raw for the impedance invariant
 * and phase-tensor azimuth, -raw for the tipper angle) and then wrapped
 * into the domain of the run's FoldMode. Statistics are only meaningful
 * after this step: -179 and 179 are 2 degrees apart, not 358.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_STRIKE_ANGLE_FOLDER_HPP
    #define MTS_STRIKE_ANGLE_FOLDER_HPP

    #include <mts/strike/PeriodAligner.hpp>
    #include <mts/strike/Types.hpp>

namespace mts::strike {

class AngleFolder final {
public:
    AngleFolder() = delete;

    /**
     * @brief Converts a raw angle to the clockwise-from-north convention.
     */
    [[nodiscard]] static double toClockwiseFromNorth(double raw, Estimator estimator) noexcept;

    /**
     * @brief Wraps an angle into (-90, 90] (kFolded) or [0, 360) (kUnfolded).
     *
     * Any multiple of the period is removed. NaN is returned unchanged.
     */
    [[nodiscard]] static double wrap(double angle, FoldMode mode) noexcept;

    /**
     * @brief toClockwiseFromNorth() followed by wrap().
     */
    [[nodiscard]] static double fold(double raw, Estimator estimator, FoldMode mode) noexcept;

    /**
     * @brief Returns a copy of @p table with every filled cell folded.
     */
    [[nodiscard]] static AlignedTable foldTable(AlignedTable table, FoldMode mode);
};

} // namespace mts::strike

#endif // MTS_STRIKE_ANGLE_FOLDER_HPP
