/**
 * @file StationRecord.hpp
 * @brief Immutable per-station sounding: periods and three raw strike series.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_STRIKE_STATION_RECORD_HPP
    #define MTS_STRIKE_STATION_RECORD_HPP

    #include <mts/core/Error.hpp>
    #include <mts/strike/Types.hpp>

    #include <optional>
    #include <span>
    #include <string>
    #include <vector>

namespace mts::strike {

/**
 * @brief Raw fields of a sounding, as handed over by a sounding reader.
 *
 * Angles use the upstream convention (counter-clockwise from east).
 * A NaN angle marks an estimator that is undefined at that period.
 */
struct StationData {
    std::string         stationId;
    std::vector<double> periods;
    std::vector<double> invariantAngle;
    std::vector<double> ptAzimuth;
    std::vector<double> tipperAngle;
    std::optional<std::vector<double>> ptAzimuthVariance;
};

/**
 * @brief Validated, read-only sounding of one station.
 *
 * Invariant: every per-estimator sequence has the length of periods(),
 * every period is finite and strictly positive.
 */
class StationRecord final {
public:
    /**
     * @brief Validates @p data and freezes it into a record.
     * @return The record, or kInvalidInput describing the first violation.
     */
    [[nodiscard]] static core::Expected<StationRecord> create(StationData data);

    [[nodiscard]] const std::string &stationId() const noexcept { return _data.stationId; }
    [[nodiscard]] std::span<const double> periods() const noexcept { return _data.periods; }
    [[nodiscard]] core::usize size() const noexcept { return _data.periods.size(); }

    /**
     * @brief Raw angle series of one estimator.
     */
    [[nodiscard]] std::span<const double> angles(Estimator estimator) const noexcept;

    [[nodiscard]] bool hasPtVariance() const noexcept { return _data.ptAzimuthVariance.has_value(); }

    /**
     * @brief Phase-tensor azimuth variance; empty when not supplied.
     */
    [[nodiscard]] std::span<const double> ptAzimuthVariance() const noexcept;

    [[nodiscard]] double minPeriod() const noexcept;
    [[nodiscard]] double maxPeriod() const noexcept;

private:
    explicit StationRecord(StationData data) : _data(std::move(data)) {}

    StationData _data;
};

} // namespace mts::strike

#endif // MTS_STRIKE_STATION_RECORD_HPP
