/**
 * @file StatisticsReport.cpp
 * @brief Assembly of the per-decade and per-station statistic tables.
 * @author MasterLaplace
 */

#include "mts/strike/StatisticsReport.hpp"

#include <mts/core/Log.hpp>
#include <mts/strike/DecadeBinner.hpp>

namespace mts::strike {

const DecadeSummary *StrikeReport::find(core::usize decade, Estimator estimator) const noexcept
{
    for (core::usize i = 0; i < estimators.size(); ++i) {
        if (estimators[i] != estimator)
            continue;
        const core::usize idx = decade * estimators.size() + i;
        return idx < summaries.size() ? &summaries[idx] : nullptr;
    }
    return nullptr;
}

const DecadeSummary *StrikeReport::aggregateFor(Estimator estimator) const noexcept
{
    for (const auto &s : aggregate) {
        if (s.estimator == estimator)
            return &s;
    }
    return nullptr;
}

const StationTable *StrikeReport::stationTable(Estimator estimator) const noexcept
{
    for (const auto &t : stationTables) {
        if (t.estimator == estimator)
            return &t;
    }
    return nullptr;
}

core::Expected<DecadeSummary> StatisticsReport::summarize(
    const DecadeBin &bin,
    Estimator estimator,
    std::span<const double> samples,
    const AnalysisConfig &config)
{
    auto histogram = MTS_TRY(CircularHistogram::build(samples, config.binWidth(), config.foldMode()));

    DecadeSummary summary{
        .bin = bin,
        .estimator = estimator,
        .statistic = CircularHistogram::statistic(samples, histogram, config.meanMethod()),
        .histogram = std::move(histogram),
        .issue = std::nullopt,
    };

    if (samples.empty()) {
        summary.issue = core::Error(core::ErrorCode::kEmptyBin,
            "no " + std::string(estimatorName(estimator)) + " samples in " + bin.label());
    }

    return summary;
}

core::Expected<StationTable> StatisticsReport::stationTable(
    std::span<const StationRecord> stations,
    Estimator estimator,
    const std::vector<DecadeBin> &decades,
    const AnalysisConfig &config)
{
    const SampleFilter filter{
        .foldMode = config.foldMode(),
        .errorFloor = config.errorFloor(),
        .excludeExactZero = config.excludeExactZero(),
    };

    StationTable table{.estimator = estimator, .rows = {}};
    table.rows.reserve(stations.size());

    for (const auto &station : stations) {
        StationRow row{.stationId = station.stationId(), .perDecade = {}};
        row.perDecade.reserve(decades.size());

        for (const auto &bin : decades) {
            const auto samples = DecadeBinner::stationSamplesIn(station, estimator, bin, filter);
            auto histogram = MTS_TRY(
                CircularHistogram::build(samples, config.binWidth(), config.foldMode()));
            row.perDecade.push_back(
                CircularHistogram::statistic(samples, histogram, config.meanMethod()));
        }

        table.rows.push_back(std::move(row));
    }

    return table;
}

core::Expected<StrikeReport> StatisticsReport::assemble(
    const AnalysisConfig &config,
    const CanonicalGrid &grid,
    std::span<const StationRecord> stations,
    std::span<const EstimatorInput> inputs)
{
    StrikeReport report;
    report.config  = config;
    report.grid    = grid;
    report.decades = DecadeBinner::decades(grid, config.decadeRange());

    for (const auto &input : inputs) {
        report.estimators.push_back(input.folded.estimator());
        report.diagnostics.insert(report.diagnostics.end(),
            input.diagnostics.begin(), input.diagnostics.end());
    }

    auto record = [&report](const DecadeSummary &summary) {
        if (!summary.issue)
            return;
        core::Log::warn("StatisticsReport", summary.issue->message());
        report.issues.push_back(*summary.issue);
    };

    report.summaries.reserve(report.decades.size() * inputs.size());
    for (const auto &bin : report.decades) {
        const auto rows = DecadeBinner::rowsIn(grid, bin);
        for (const auto &input : inputs) {
            const auto samples = DecadeBinner::samplesIn(input.folded, rows, config.excludeExactZero());
            auto summary = MTS_TRY(summarize(bin, input.folded.estimator(), samples, config));
            record(summary);
            report.summaries.push_back(std::move(summary));
        }
    }

    const DecadeBin all = DecadeBinner::aggregate(grid, config.decadeRange());
    const auto allRows  = DecadeBinner::rowsIn(grid, all);
    for (const auto &input : inputs) {
        const auto samples = DecadeBinner::samplesIn(input.folded, allRows, config.excludeExactZero());
        auto summary = MTS_TRY(summarize(all, input.folded.estimator(), samples, config));
        record(summary);
        report.aggregate.push_back(std::move(summary));
    }

    for (const auto &input : inputs) {
        report.stationTables.push_back(
            MTS_TRY(stationTable(stations, input.folded.estimator(), report.decades, config)));
    }

    return report;
}

} // namespace mts::strike
