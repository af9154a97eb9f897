/**
 * @file TestDecadeBinner.cpp
 * @brief Unit tests for mts::strike::DecadeBinner.
 */

#include <catch2/catch_test_macros.hpp>

#include "mts/strike/DecadeBinner.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace mts::strike;
using mts::core::usize;

namespace {

StationRecord makeStation(std::vector<double> periods, std::vector<double> pt = {},
                          std::optional<std::vector<double>> variance = std::nullopt)
{
    const auto n = periods.size();
    if (pt.empty())
        pt.assign(n, 60.0);
    auto record = StationRecord::create(StationData{
        .stationId = "s",
        .periods = std::move(periods),
        .invariantAngle = std::vector<double>(n, 10.0),
        .ptAzimuth = std::move(pt),
        .tipperAngle = std::vector<double>(n, 30.0),
        .ptAzimuthVariance = std::move(variance),
    });
    REQUIRE(record.has_value());
    return std::move(*record);
}

CanonicalGrid wideGrid()
{
    std::vector<StationRecord> stations;
    stations.push_back(makeStation(PeriodGrid::logspace(0.01, 1000.0, 25)));
    auto grid = PeriodGrid::build(stations);
    REQUIRE(grid.has_value());
    return std::move(*grid);
}

} // namespace

TEST_CASE("DecadeBinner snaps exact powers of ten", "[strike][decade]")
{
    REQUIRE(DecadeBinner::exponentOf(1000.0) == 3.0);
    REQUIRE(DecadeBinner::exponentOf(0.001) == -3.0);
    REQUIRE(DecadeBinner::exponentOf(1.0) == 0.0);
    REQUIRE(DecadeBinner::exponentOf(5.0) > 0.69);
}

TEST_CASE("DecadeBinner covers 0.01 to 1000 s with six decades", "[strike][decade]")
{
    REQUIRE(DecadeBinner::autoRange(0.01, 1000.0) == DecadeRange{-2, 4});

    const auto grid = wideGrid();
    const auto bins = DecadeBinner::decades(grid);
    REQUIRE(bins.size() == 6);
    REQUIRE(bins.front().range == DecadeRange{-2, -1});
    REQUIRE(bins.back().range == DecadeRange{3, 4});
    REQUIRE(bins.front().label() == "0.01-0.1s");
    for (const auto &bin : bins)
        REQUIRE_FALSE(bin.aggregate);
}

TEST_CASE("DecadeBinner partitions the grid", "[strike][decade]")
{
    const auto grid = wideGrid();
    const auto bins = DecadeBinner::decades(grid);

    std::vector<int> hits(grid.size(), 0);
    for (const auto &bin : bins) {
        for (const usize row : DecadeBinner::rowsIn(grid, bin))
            ++hits[row];
    }
    for (const int h : hits)
        REQUIRE(h == 1);

    // 1000 s sits on a decade boundary and belongs to the upper bin.
    const auto top = DecadeBinner::rowsIn(grid, bins.back());
    REQUIRE(top.size() == 1);
    REQUIRE(top.front() == grid.size() - 1);
}

TEST_CASE("DecadeBinner honours an explicit range", "[strike][decade]")
{
    const auto grid = wideGrid();

    const auto bins = DecadeBinner::decades(grid, DecadeRange{0, 2});
    REQUIRE(bins.size() == 2);
    REQUIRE(bins[0].range == DecadeRange{0, 1});
    REQUIRE(bins[1].range == DecadeRange{1, 2});

    const auto all = DecadeBinner::aggregate(grid, DecadeRange{0, 2});
    REQUIRE(all.aggregate);
    REQUIRE(all.range == DecadeRange{0, 2});

    usize inBins = 0;
    for (const auto &bin : bins)
        inBins += DecadeBinner::rowsIn(grid, bin).size();
    REQUIRE(DecadeBinner::rowsIn(grid, all).size() == inBins);

    REQUIRE(DecadeBinner::decades(grid, DecadeRange{2, 2}).empty());
}

TEST_CASE("DecadeBinner collects filled cells of the selected rows", "[strike][decade]")
{
    AlignedTable table(Estimator::kPhaseTensor, 3, {"a", "b"});
    table.set(0, 0, 12.0);
    table.set(0, 1, 0.0);
    table.set(1, 1, 40.0);
    table.set(2, 0, -30.0);

    const std::vector<usize> rows{0, 1};
    REQUIRE(DecadeBinner::samplesIn(table, rows) == std::vector<double>{12.0, 0.0, 40.0});
    REQUIRE(DecadeBinner::samplesIn(table, rows, true) == std::vector<double>{12.0, 40.0});
    REQUIRE(DecadeBinner::samplesIn(table, {}).empty());
}

TEST_CASE("DecadeBinner selects a station's own samples", "[strike][decade]")
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto station = makeStation({0.5, 2.0, 5.0, 20.0}, {60.0, nan, 90.0, 70.0},
                                     std::vector<double>{1.0, 1.0, 9.0, 1.0});
    const DecadeBin bin{.range = {0, 1}, .aggregate = false};

    SECTION("undefined angles are skipped")
    {
        const auto samples = DecadeBinner::stationSamplesIn(
            station, Estimator::kPhaseTensor, bin, SampleFilter{});
        REQUIRE(samples == std::vector<double>{0.0});
    }

    SECTION("the error floor zeroes a noisy azimuth, which folds to 90")
    {
        const auto samples = DecadeBinner::stationSamplesIn(
            station, Estimator::kPhaseTensor, bin, SampleFilter{.errorFloor = 5.0});
        REQUIRE(samples == std::vector<double>{90.0});
    }

    SECTION("excluding exact zero drops the folded 90 degree azimuth")
    {
        const auto samples = DecadeBinner::stationSamplesIn(
            station, Estimator::kPhaseTensor, bin, SampleFilter{.excludeExactZero = true});
        REQUIRE(samples.empty());
    }

    SECTION("tipper folding follows the fold mode")
    {
        const auto samples = DecadeBinner::stationSamplesIn(
            station, Estimator::kTipper, bin, SampleFilter{.foldMode = FoldMode::kUnfolded});
        REQUIRE(samples == std::vector<double>{330.0, 330.0});
    }
}
