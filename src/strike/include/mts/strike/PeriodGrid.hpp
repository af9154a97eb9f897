/**
 * @file PeriodGrid.hpp
 * @brief Canonical logarithmic period grid shared by all stations of a run.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_STRIKE_PERIOD_GRID_HPP
    #define MTS_STRIKE_PERIOD_GRID_HPP

    #include <mts/core/Error.hpp>
    #include <mts/strike/StationRecord.hpp>

    #include <span>
    #include <vector>

namespace mts::strike {

/**
 * @brief Strictly increasing periods, evenly spaced in log10.
 */
class CanonicalGrid final {
public:
    CanonicalGrid() = default;

    [[nodiscard]] core::usize size() const noexcept { return _periods.size(); }
    [[nodiscard]] bool empty() const noexcept { return _periods.empty(); }
    [[nodiscard]] double at(core::usize index) const noexcept { return _periods[index]; }
    [[nodiscard]] std::span<const double> periods() const noexcept { return _periods; }

    [[nodiscard]] double minPeriod() const noexcept { return _periods.front(); }
    [[nodiscard]] double maxPeriod() const noexcept { return _periods.back(); }

private:
    friend class PeriodGrid;

    explicit CanonicalGrid(std::vector<double> periods) : _periods(std::move(periods)) {}

    std::vector<double> _periods;
};

/**
 * @brief Builds the CanonicalGrid of a station set.
 */
class PeriodGrid final {
public:
    PeriodGrid() = delete;

    /**
     * @brief Spans the global minimum to maximum period with as many points
     *        as the longest station record.
     *
     * The endpoints are the observed extrema exactly. When every station
     * shares a single period the grid holds that one period.
     *
     * @param stations Full station set of the run.
     * @return The grid, or kInvalidInput when @p stations is empty.
     */
    [[nodiscard]] static core::Expected<CanonicalGrid> build(
        std::span<const StationRecord> stations);

    /**
     * @brief numpy-style logspace between two positive periods, inclusive.
     */
    [[nodiscard]] static std::vector<double> logspace(
        double periodMin,
        double periodMax,
        core::usize count);
};

} // namespace mts::strike

#endif // MTS_STRIKE_PERIOD_GRID_HPP
