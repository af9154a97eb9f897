/**
 * @file DecadeBinner.hpp
 * @brief Partition of periods into logarithmic decades.
 *
 * Decades are half-open exponent ranges [b, b+1) in log10(period). The
 * automatic range runs from floor(log10(pMin)) to floor(log10(pMax)) + 1 so
 * that the largest period always falls inside a bin, even when it is an
 * exact power of ten.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_STRIKE_DECADE_BINNER_HPP
    #define MTS_STRIKE_DECADE_BINNER_HPP

    #include <mts/strike/PeriodAligner.hpp>
    #include <mts/strike/PeriodGrid.hpp>
    #include <mts/strike/StationRecord.hpp>
    #include <mts/strike/Types.hpp>

    #include <optional>
    #include <vector>

namespace mts::strike {

/**
 * @brief Options applied when collecting the samples of a bin.
 */
struct SampleFilter {
    FoldMode foldMode = FoldMode::kFolded;
    std::optional<double> errorFloor;
    /// Also drop folded values equal to 0.0 (legacy "zero means no data").
    bool excludeExactZero = false;
};

class DecadeBinner final {
public:
    DecadeBinner() = delete;

    /**
     * @brief log10(@p period), snapped to the nearest integer when within
     *        kExponentSnapEps of it.
     */
    [[nodiscard]] static double exponentOf(double period) noexcept;

    /**
     * @brief Automatic decade range covering [pMin, pMax].
     */
    [[nodiscard]] static DecadeRange autoRange(double periodMin, double periodMax) noexcept;

    /**
     * @brief One bin per decade of @p range, or of the grid's automatic
     *        range when @p range is empty.
     */
    [[nodiscard]] static std::vector<DecadeBin> decades(
        const CanonicalGrid &grid,
        const std::optional<DecadeRange> &range = std::nullopt);

    /**
     * @brief A single bin spanning the whole requested range.
     */
    [[nodiscard]] static DecadeBin aggregate(
        const CanonicalGrid &grid,
        const std::optional<DecadeRange> &range = std::nullopt);

    /**
     * @brief Grid indices whose period falls inside @p bin.
     */
    [[nodiscard]] static std::vector<core::usize> rowsIn(
        const CanonicalGrid &grid,
        const DecadeBin &bin);

    /**
     * @brief Filled cells of @p rows across every station of @p table.
     *
     * The table is expected to be folded already.
     */
    [[nodiscard]] static std::vector<double> samplesIn(
        const AlignedTable &table,
        const std::vector<core::usize> &rows,
        bool excludeExactZero = false);

    /**
     * @brief Folded samples of one station whose own periods fall in @p bin.
     */
    [[nodiscard]] static std::vector<double> stationSamplesIn(
        const StationRecord &station,
        Estimator estimator,
        const DecadeBin &bin,
        const SampleFilter &filter);
};

} // namespace mts::strike

#endif // MTS_STRIKE_DECADE_BINNER_HPP
