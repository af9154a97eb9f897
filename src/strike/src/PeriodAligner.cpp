/**
 * @file PeriodAligner.cpp
 * @brief Tolerance-based alignment of station periods onto the grid.
 * @author MasterLaplace
 */

#include "mts/strike/PeriodAligner.hpp"

#include <mts/core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace mts::strike {

AlignedTable::AlignedTable(Estimator estimator, core::usize rows, std::vector<std::string> stationIds)
    : _estimator(estimator),
      _rows(rows),
      _stationIds(std::move(stationIds)),
      _cells(rows * _stationIds.size())
{
}

core::usize AlignedTable::filledCount() const noexcept
{
    return static_cast<core::usize>(std::count_if(_cells.begin(), _cells.end(),
        [](const std::optional<double> &c) { return c.has_value(); }));
}

bool PeriodAligner::matches(double period, double gridPeriod, double tolerance) noexcept
{
    return std::abs(period - gridPeriod) < tolerance * gridPeriod;
}

std::optional<core::usize> PeriodAligner::nearestRow(
    const CanonicalGrid &grid, double period, double tolerance) noexcept
{
    const auto gp = grid.periods();
    if (gp.empty())
        return std::nullopt;

    // Candidates are the grid periods on either side of the sample.
    const auto upper = std::lower_bound(gp.begin(), gp.end(), period);
    auto best = static_cast<core::usize>(std::min(upper, gp.end() - 1) - gp.begin());
    if (upper != gp.begin()) {
        const auto below = static_cast<core::usize>(upper - gp.begin()) - 1;
        if (std::abs(period - gp[below]) / gp[below] <= std::abs(period - gp[best]) / gp[best])
            best = below;
    }
    if (!matches(period, gp[best], tolerance))
        return std::nullopt;
    return best;
}

double PeriodAligner::sampleValue(
    const StationRecord &station,
    Estimator estimator,
    core::usize index,
    const std::optional<double> &errorFloor) noexcept
{
    const double raw = station.angles(estimator)[index];
    if (estimator != Estimator::kPhaseTensor || !errorFloor || !station.hasPtVariance())
        return raw;

    // Legacy behaviour: rejected azimuths become 0.0, they are not removed.
    if (station.ptAzimuthVariance()[index] > *errorFloor)
        return 0.0;
    return raw;
}

core::Expected<AlignmentResult> PeriodAligner::align(
    const CanonicalGrid &grid,
    std::span<const StationRecord> stations,
    Estimator estimator,
    const AlignOptions &options)
{
    if (!(options.tolerance > 0.0 && options.tolerance < 1.0)) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "period tolerance must lie in (0, 1), got " + std::to_string(options.tolerance));
    }

    std::vector<std::string> ids;
    ids.reserve(stations.size());
    for (const auto &station : stations)
        ids.push_back(station.stationId());

    AlignmentResult result{
        .table = AlignedTable(estimator, grid.size(), std::move(ids)),
        .diagnostics = {},
    };
    result.diagnostics.reserve(stations.size());

    for (core::usize col = 0; col < stations.size(); ++col) {
        const auto &station = stations[col];
        const auto periods  = station.periods();

        AlignmentDiagnostics diag{
            .stationId = station.stationId(),
            .estimator = estimator,
        };

        for (core::usize j = 0; j < periods.size(); ++j) {
            const double value = sampleValue(station, estimator, j, options.errorFloor);
            if (std::isnan(value))
                continue;
            ++diag.samplesTotal;
            const auto row = nearestRow(grid, periods[j], options.tolerance);
            if (!row)
                continue;
            ++diag.samplesMatched;
            if (result.table.filled(*row, col))
                continue;
            result.table.set(*row, col, value);
            ++diag.cellsFilled;
        }

        if (diag.samplesMatched < diag.samplesTotal) {
            core::Log::debug("PeriodAligner",
                "station " + diag.stationId + " (" + std::string(estimatorName(estimator)) +
                "): dropped " + std::to_string(diag.samplesTotal - diag.samplesMatched) +
                " of " + std::to_string(diag.samplesTotal) + " samples");
        }

        result.diagnostics.push_back(std::move(diag));
    }

    return result;
}

} // namespace mts::strike
