/**
 * @file PeriodGrid.cpp
 * @brief Construction of the canonical period grid.
 * @author MasterLaplace
 */

#include "mts/strike/PeriodGrid.hpp"

#include <mts/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace mts::strike {

core::Expected<CanonicalGrid> PeriodGrid::build(std::span<const StationRecord> stations)
{
    if (stations.empty()) {
        return core::makeError(core::ErrorCode::kInvalidInput,
            "cannot build a period grid from an empty station set");
    }

    double periodMin = std::numeric_limits<double>::infinity();
    double periodMax = 0.0;
    core::usize longest = 0;

    for (const auto &station : stations) {
        periodMin = std::min(periodMin, station.minPeriod());
        periodMax = std::max(periodMax, station.maxPeriod());
        longest   = std::max(longest, station.size());
    }

    if (periodMin == periodMax)
        longest = 1;

    auto grid = CanonicalGrid(logspace(periodMin, periodMax, longest));

    core::Log::debug("PeriodGrid",
        "grid of " + std::to_string(grid.size()) + " periods from " +
        std::to_string(periodMin) + "s to " + std::to_string(periodMax) + "s");

    return grid;
}

std::vector<double> PeriodGrid::logspace(double periodMin, double periodMax, core::usize count)
{
    std::vector<double> out;
    if (count == 0)
        return out;

    out.reserve(count);
    if (count == 1) {
        out.push_back(periodMin);
        return out;
    }

    const double lo   = std::log10(periodMin);
    const double hi   = std::log10(periodMax);
    const double step = (hi - lo) / static_cast<double>(count - 1);

    for (core::usize i = 0; i < count; ++i)
        out.push_back(std::pow(10.0, lo + step * static_cast<double>(i)));

    out.front() = periodMin;
    out.back()  = periodMax;
    return out;
}

} // namespace mts::strike
