/**
 * @file PeriodAligner.hpp
 * @brief Maps station samples onto canonical grid indices within a
 *        relative period tolerance.
 *
 * Alignment is independent per estimator: a tipper angle can be undefined
 * at a period where the impedance-based estimates exist.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_STRIKE_PERIOD_ALIGNER_HPP
    #define MTS_STRIKE_PERIOD_ALIGNER_HPP

    #include <mts/core/Assert.hpp>
    #include <mts/core/Error.hpp>
    #include <mts/strike/PeriodGrid.hpp>
    #include <mts/strike/StationRecord.hpp>
    #include <mts/strike/Types.hpp>

    #include <optional>
    #include <span>
    #include <string>
    #include <vector>

namespace mts::strike {

/**
 * @brief Grid-index by station table of angles for one estimator.
 *
 * An empty cell means no sample. Memory layout: cells[row * stations + col].
 */
class AlignedTable final {
public:
    AlignedTable() = default;
    AlignedTable(Estimator estimator, core::usize rows, std::vector<std::string> stationIds);

    [[nodiscard]] Estimator estimator() const noexcept { return _estimator; }
    [[nodiscard]] core::usize rows() const noexcept { return _rows; }
    [[nodiscard]] core::usize stations() const noexcept { return _stationIds.size(); }
    [[nodiscard]] const std::vector<std::string> &stationIds() const noexcept { return _stationIds; }

    [[nodiscard]] const std::optional<double> &at(core::usize row, core::usize station) const noexcept
    {
        MTS_ASSERT(row < _rows && station < stations());
        return _cells[row * stations() + station];
    }

    void set(core::usize row, core::usize station, double value) noexcept
    {
        MTS_ASSERT(row < _rows && station < stations());
        _cells[row * stations() + station] = value;
    }

    [[nodiscard]] bool filled(core::usize row, core::usize station) const noexcept
    {
        return at(row, station).has_value();
    }

    /**
     * @brief Number of filled cells in the whole table.
     */
    [[nodiscard]] core::usize filledCount() const noexcept;

    /**
     * @brief Applies @p fn to every filled cell in place.
     */
    template <typename Fn>
    void transform(Fn &&fn)
    {
        for (auto &cell : _cells) {
            if (cell)
                *cell = fn(*cell);
        }
    }

private:
    Estimator _estimator = Estimator::kInvariant;
    core::usize _rows = 0;
    std::vector<std::string> _stationIds;
    std::vector<std::optional<double>> _cells;
};

/**
 * @brief Parameters of one alignment pass.
 */
struct AlignOptions {
    double tolerance = core::kDefaultPeriodTolerance;
    std::optional<double> errorFloor;
};

/**
 * @brief Aligned table plus one diagnostics entry per station.
 */
struct AlignmentResult {
    AlignedTable table;
    std::vector<AlignmentDiagnostics> diagnostics;
};

/**
 * @brief Period alignment of a station set onto a CanonicalGrid.
 */
class PeriodAligner final {
public:
    PeriodAligner() = delete;

    /**
     * @brief True when @p period lies within @p tolerance of @p gridPeriod,
     *        i.e. |period - gridPeriod| < tolerance * gridPeriod.
     */
    [[nodiscard]] static bool matches(double period, double gridPeriod, double tolerance) noexcept;

    /**
     * @brief Raw angle of sample @p index after the variance error floor.
     *
     * With an error floor set, phase-tensor azimuths whose variance exceeds
     * the floor read as 0.0. Other estimators are returned untouched.
     */
    [[nodiscard]] static double sampleValue(
        const StationRecord &station,
        Estimator estimator,
        core::usize index,
        const std::optional<double> &errorFloor) noexcept;

    /**
     * @brief Grid index closest to @p period in relative distance, or
     *        nullopt when that index does not match within @p tolerance.
     *
     * Ties go to the lower index.
     */
    [[nodiscard]] static std::optional<core::usize> nearestRow(
        const CanonicalGrid &grid, double period, double tolerance) noexcept;

    /**
     * @brief Fills one AlignedTable for @p estimator.
     *
     * Each sample with a defined angle goes to its nearestRow(), so one
     * sample fills at most one cell. When several samples share a grid
     * index the first in record order fills it. Samples matching no grid
     * period are dropped and only counted.
     *
     * @return The table and diagnostics, or kInvalidArgument when the
     *         tolerance is outside (0, 1).
     */
    [[nodiscard]] static core::Expected<AlignmentResult> align(
        const CanonicalGrid &grid,
        std::span<const StationRecord> stations,
        Estimator estimator,
        const AlignOptions &options = {});
};

} // namespace mts::strike

#endif // MTS_STRIKE_PERIOD_ALIGNER_HPP
