/**
 * @file TestPeriodAligner.cpp
 * @brief Unit tests for mts::strike::PeriodAligner.
 */

#include <catch2/catch_test_macros.hpp>

#include "mts/strike/PeriodAligner.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace mts::strike;
using mts::core::usize;

namespace {

StationRecord makeStation(const std::string &id,
                          std::vector<double> periods,
                          std::vector<double> invariant,
                          std::optional<std::vector<double>> ptVariance = std::nullopt)
{
    const auto n = periods.size();
    std::vector<double> pt(n);
    for (usize i = 0; i < n; ++i)
        pt[i] = 100.0 + static_cast<double>(i);
    auto record = StationRecord::create(StationData{
        .stationId = id,
        .periods = std::move(periods),
        .invariantAngle = std::move(invariant),
        .ptAzimuth = std::move(pt),
        .tipperAngle = std::vector<double>(n, 0.0),
        .ptAzimuthVariance = std::move(ptVariance),
    });
    REQUIRE(record.has_value());
    return std::move(*record);
}

CanonicalGrid gridOf(const std::vector<StationRecord> &stations)
{
    auto grid = PeriodGrid::build(stations);
    REQUIRE(grid.has_value());
    return std::move(*grid);
}

} // namespace

TEST_CASE("PeriodAligner::matches uses a relative strict bound", "[strike][aligner]")
{
    REQUIRE(PeriodAligner::matches(1.02, 1.0, 0.05));
    REQUIRE(PeriodAligner::matches(9.8, 10.0, 0.05));
    REQUIRE_FALSE(PeriodAligner::matches(1.5, 1.0, 0.05));
    REQUIRE_FALSE(PeriodAligner::matches(3.0, 10.0, 0.05));
}

TEST_CASE("PeriodAligner places near-grid samples on the grid", "[strike][aligner]")
{
    std::vector<StationRecord> stations;
    stations.push_back(makeStation("a", {1.0, 10.0, 100.0}, {10.0, 20.0, 30.0}));
    stations.push_back(makeStation("b", {1.02, 9.8, 105.0}, {15.0, 25.0, 35.0}));
    const auto grid = gridOf(stations);

    auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant);
    REQUIRE(result.has_value());

    const auto &table = result->table;
    REQUIRE(table.rows() == 3);
    REQUIRE(table.stations() == 2);
    REQUIRE(table.stationIds() == std::vector<std::string>{"a", "b"});
    REQUIRE(table.at(0, 0) == 10.0);
    REQUIRE(table.at(0, 1) == 15.0);
    REQUIRE(table.filledCount() == 6);

    REQUIRE(result->diagnostics.size() == 2);
    for (const auto &diag : result->diagnostics) {
        REQUIRE(diag.estimator == Estimator::kInvariant);
        REQUIRE(diag.samplesTotal == 3);
        REQUIRE(diag.samplesMatched == 3);
        REQUIRE(diag.matchRatio() == 1.0);
    }
}

TEST_CASE("PeriodAligner keeps the first matching sample", "[strike][aligner]")
{
    std::vector<StationRecord> stations;
    stations.push_back(makeStation("a", {1.0, 10.0, 100.0}, {10.0, 20.0, 30.0}));
    stations.push_back(makeStation("b", {1.01, 1.02, 10.0}, {11.0, 12.0, 13.0}));
    const auto grid = gridOf(stations);

    auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant);
    REQUIRE(result.has_value());

    const auto &table = result->table;
    REQUIRE(table.at(0, 1) == 11.0);
    REQUIRE(table.at(1, 1) == 13.0);
    REQUIRE_FALSE(table.filled(2, 1));

    const auto &diag = result->diagnostics[1];
    REQUIRE(diag.stationId == "b");
    REQUIRE(diag.samplesMatched == 3);
    REQUIRE(diag.cellsFilled == 2);
}

TEST_CASE("PeriodAligner drops samples far from every grid period", "[strike][aligner]")
{
    std::vector<StationRecord> stations;
    stations.push_back(makeStation("a", {1.0, 10.0, 100.0}, {10.0, 20.0, 30.0}));
    stations.push_back(makeStation("c", {1.0, 3.0, 100.0}, {40.0, 50.0, 60.0}));
    const auto grid = gridOf(stations);

    auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant);
    REQUIRE(result.has_value());

    REQUIRE_FALSE(result->table.filled(1, 1));
    REQUIRE(result->diagnostics[1].samplesTotal == 3);
    REQUIRE(result->diagnostics[1].samplesMatched == 2);
    REQUIRE(result->diagnostics[1].cellsFilled == 2);
}

TEST_CASE("PeriodAligner skips undefined angles", "[strike][aligner]")
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<StationRecord> stations;
    stations.push_back(makeStation("a", {1.0, 1.01, 10.0}, {nan, 42.0, nan}));
    const auto grid = gridOf(stations);

    auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant);
    REQUIRE(result.has_value());

    // 1.01 is the next sample within tolerance of the first grid period.
    REQUIRE(result->table.at(0, 0) == 42.0);
    REQUIRE(result->diagnostics[0].samplesTotal == 1);
    REQUIRE(result->table.filledCount() == 1);
}

TEST_CASE("PeriodAligner fills more with a wider tolerance", "[strike][aligner]")
{
    std::vector<StationRecord> stations;
    stations.push_back(makeStation("a", {1.0, 1.3, 2.0, 5.0, 10.0}, {1.0, 2.0, 3.0, 4.0, 5.0}));
    stations.push_back(makeStation("b", {1.2, 3.0, 7.0}, {6.0, 7.0, 8.0}));
    const auto grid = gridOf(stations);

    usize lastFilled = 0;
    usize lastMatched = 0;
    for (double tau : {0.01, 0.05, 0.1, 0.2, 0.4, 0.8}) {
        auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant, {.tolerance = tau});
        REQUIRE(result.has_value());

        usize matched = 0;
        for (const auto &diag : result->diagnostics)
            matched += diag.samplesMatched;

        REQUIRE(result->table.filledCount() >= lastFilled);
        REQUIRE(matched >= lastMatched);
        lastFilled = result->table.filledCount();
        lastMatched = matched;
    }
    REQUIRE(lastFilled > 0);
}

TEST_CASE("PeriodAligner fills at most one cell per sample", "[strike][aligner]")
{
    // 81 points over one decade are about 3% apart, closer than the 5% tolerance.
    auto dense = PeriodGrid::logspace(1.0, 10.0, 81);
    std::vector<double> denseAngles(dense.size(), 10.0);

    std::vector<StationRecord> stations;
    stations.push_back(makeStation("dense", std::move(dense), std::move(denseAngles)));
    stations.push_back(makeStation("sparse", {3.0}, {42.0}));
    const auto grid = gridOf(stations);
    REQUIRE(grid.size() == 81);

    auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant, {.tolerance = 0.05});
    REQUIRE(result.has_value());

    const auto &sparse = result->diagnostics[1];
    REQUIRE(sparse.samplesTotal == 1);
    REQUIRE(sparse.samplesMatched == 1);
    REQUIRE(sparse.cellsFilled == 1);

    usize sparseCells = 0;
    for (usize row = 0; row < grid.size(); ++row) {
        if (result->table.filled(row, 1)) {
            ++sparseCells;
            REQUIRE(*result->table.at(row, 1) == 42.0);
            // The cell is the grid period nearest to 3 s.
            REQUIRE(std::abs(grid.at(row) - 3.0) < 0.05);
        }
    }
    REQUIRE(sparseCells == 1);

    for (const auto &diag : result->diagnostics)
        REQUIRE(diag.cellsFilled <= diag.samplesMatched);
}

TEST_CASE("PeriodAligner rejects tolerances outside (0, 1)", "[strike][aligner]")
{
    std::vector<StationRecord> stations;
    stations.push_back(makeStation("a", {1.0, 10.0}, {1.0, 2.0}));
    const auto grid = gridOf(stations);

    for (double tau : {0.0, -0.1, 1.0, 2.5}) {
        auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant, {.tolerance = tau});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == mts::core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("PeriodAligner applies the phase-tensor error floor", "[strike][aligner]")
{
    std::vector<StationRecord> stations;
    stations.push_back(makeStation("a", {1.0, 10.0, 100.0}, {10.0, 20.0, 30.0},
                                   std::vector<double>{1.0, 10.0, 1.0}));
    const auto grid = gridOf(stations);

    SECTION("without a floor every azimuth is kept")
    {
        auto result = PeriodAligner::align(grid, stations, Estimator::kPhaseTensor);
        REQUIRE(result.has_value());
        REQUIRE(result->table.at(1, 0) == 101.0);
    }

    SECTION("azimuths above the floor read as zero")
    {
        auto result = PeriodAligner::align(grid, stations, Estimator::kPhaseTensor,
                                           {.tolerance = 0.05, .errorFloor = 5.0});
        REQUIRE(result.has_value());
        REQUIRE(result->table.at(0, 0) == 100.0);
        REQUIRE(result->table.at(1, 0) == 0.0);
        REQUIRE(result->table.at(2, 0) == 102.0);
    }

    SECTION("other estimators ignore the floor")
    {
        auto result = PeriodAligner::align(grid, stations, Estimator::kInvariant,
                                           {.tolerance = 0.05, .errorFloor = 5.0});
        REQUIRE(result.has_value());
        REQUIRE(result->table.at(1, 0) == 20.0);
    }
}
