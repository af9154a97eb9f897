/**
 * @file StationRecord.cpp
 * @brief Validation and accessors of StationRecord.
 * @author MasterLaplace
 */

#include "mts/strike/StationRecord.hpp"

#include <algorithm>
#include <cmath>

namespace mts::strike {

namespace {

// NaN marks a missing value; infinities are rejected.
core::ExpectedVoid checkSeries(
    const StationData &data,
    const std::vector<double> &series,
    std::string_view name)
{
    if (series.size() != data.periods.size()) {
        return core::makeError(core::ErrorCode::kInvalidInput,
            "station '" + data.stationId + "': " + std::string(name) + " has " +
            std::to_string(series.size()) + " values for " +
            std::to_string(data.periods.size()) + " periods");
    }
    if (std::any_of(series.begin(), series.end(), [](double v) { return std::isinf(v); })) {
        return core::makeError(core::ErrorCode::kInvalidInput,
            "station '" + data.stationId + "': " + std::string(name) + " has an infinite value");
    }
    return {};
}

} // namespace

core::Expected<StationRecord> StationRecord::create(StationData data)
{
    if (data.periods.empty()) {
        return core::makeError(core::ErrorCode::kInvalidInput,
            "station '" + data.stationId + "' has no periods");
    }

    for (const double p : data.periods) {
        if (!std::isfinite(p) || p <= 0.0) {
            return core::makeError(core::ErrorCode::kInvalidInput,
                "station '" + data.stationId + "' has a non-positive or non-finite period");
        }
    }

    MTS_TRY_VOID(checkSeries(data, data.invariantAngle, "invariant_angle"));
    MTS_TRY_VOID(checkSeries(data, data.ptAzimuth, "pt_azimuth"));
    MTS_TRY_VOID(checkSeries(data, data.tipperAngle, "tipper_angle"));
    if (data.ptAzimuthVariance)
        MTS_TRY_VOID(checkSeries(data, *data.ptAzimuthVariance, "pt_azimuth_variance"));

    return StationRecord(std::move(data));
}

std::span<const double> StationRecord::angles(Estimator estimator) const noexcept
{
    switch (estimator) {
        case Estimator::kInvariant:   return _data.invariantAngle;
        case Estimator::kPhaseTensor: return _data.ptAzimuth;
        case Estimator::kTipper:      return _data.tipperAngle;
    }
    return {};
}

std::span<const double> StationRecord::ptAzimuthVariance() const noexcept
{
    if (!_data.ptAzimuthVariance)
        return {};
    return *_data.ptAzimuthVariance;
}

double StationRecord::minPeriod() const noexcept
{
    return *std::min_element(_data.periods.begin(), _data.periods.end());
}

double StationRecord::maxPeriod() const noexcept
{
    return *std::max_element(_data.periods.begin(), _data.periods.end());
}

} // namespace mts::strike
