/**
 * @file DecadeBinner.cpp
 * @brief Decade partitioning of the canonical grid and of station samples.
 * @author MasterLaplace
 */

#include "mts/strike/DecadeBinner.hpp"

#include <mts/core/Constants.hpp>
#include <mts/strike/AngleFolder.hpp>

#include <cmath>

namespace mts::strike {

double DecadeBinner::exponentOf(double period) noexcept
{
    const double e = std::log10(period);
    const double r = std::round(e);
    return std::abs(e - r) < core::kExponentSnapEps ? r : e;
}

DecadeRange DecadeBinner::autoRange(double periodMin, double periodMax) noexcept
{
    const auto low  = static_cast<core::i32>(std::floor(exponentOf(periodMin)));
    const auto high = static_cast<core::i32>(std::floor(exponentOf(periodMax))) + 1;
    return {low, high};
}

std::vector<DecadeBin> DecadeBinner::decades(
    const CanonicalGrid &grid,
    const std::optional<DecadeRange> &range)
{
    std::vector<DecadeBin> bins;
    if (!range && grid.empty())
        return bins;

    const DecadeRange r = range ? *range : autoRange(grid.minPeriod(), grid.maxPeriod());
    if (r.span() <= 0)
        return bins;

    bins.reserve(static_cast<core::usize>(r.span()));
    for (core::i32 b = r.low; b < r.high; ++b)
        bins.push_back(DecadeBin{.range = {b, b + 1}, .aggregate = false});
    return bins;
}

DecadeBin DecadeBinner::aggregate(
    const CanonicalGrid &grid,
    const std::optional<DecadeRange> &range)
{
    if (range)
        return DecadeBin{.range = *range, .aggregate = true};
    if (grid.empty())
        return DecadeBin{.range = {0, 0}, .aggregate = true};
    return DecadeBin{.range = autoRange(grid.minPeriod(), grid.maxPeriod()), .aggregate = true};
}

std::vector<core::usize> DecadeBinner::rowsIn(const CanonicalGrid &grid, const DecadeBin &bin)
{
    std::vector<core::usize> rows;
    for (core::usize i = 0; i < grid.size(); ++i) {
        if (bin.contains(exponentOf(grid.at(i))))
            rows.push_back(i);
    }
    return rows;
}

std::vector<double> DecadeBinner::samplesIn(
    const AlignedTable &table,
    const std::vector<core::usize> &rows,
    bool excludeExactZero)
{
    std::vector<double> out;
    for (const core::usize row : rows) {
        for (core::usize col = 0; col < table.stations(); ++col) {
            const auto &cell = table.at(row, col);
            if (!cell)
                continue;
            if (excludeExactZero && *cell == 0.0)
                continue;
            out.push_back(*cell);
        }
    }
    return out;
}

std::vector<double> DecadeBinner::stationSamplesIn(
    const StationRecord &station,
    Estimator estimator,
    const DecadeBin &bin,
    const SampleFilter &filter)
{
    std::vector<double> out;
    const auto periods = station.periods();
    for (core::usize j = 0; j < periods.size(); ++j) {
        if (!bin.contains(exponentOf(periods[j])))
            continue;
        const double raw = PeriodAligner::sampleValue(station, estimator, j, filter.errorFloor);
        if (std::isnan(raw))
            continue;
        const double folded = AngleFolder::fold(raw, estimator, filter.foldMode);
        if (filter.excludeExactZero && folded == 0.0)
            continue;
        out.push_back(folded);
    }
    return out;
}

} // namespace mts::strike
