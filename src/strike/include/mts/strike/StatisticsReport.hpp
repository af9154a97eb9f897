/**
 * @file StatisticsReport.hpp
 * @brief Per-decade, per-estimator and per-station strike statistic tables.
 *
 * A StrikeReport is the complete output of one analysis run: everything a
 * rose-diagram renderer or a text-report writer needs, with no reference
 * back into the engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_STRIKE_STATISTICS_REPORT_HPP
    #define MTS_STRIKE_STATISTICS_REPORT_HPP

    #include <mts/core/Error.hpp>
    #include <mts/strike/AnalysisConfig.hpp>
    #include <mts/strike/CircularHistogram.hpp>
    #include <mts/strike/PeriodAligner.hpp>
    #include <mts/strike/PeriodGrid.hpp>
    #include <mts/strike/StationRecord.hpp>
    #include <mts/strike/Types.hpp>

    #include <optional>
    #include <span>
    #include <string>
    #include <vector>

namespace mts::strike {

/**
 * @brief Statistic and histogram of one (decade, estimator) pair.
 *
 * issue holds a kEmptyBin error when no sample fell in the bin; the
 * statistic fields are then NaN.
 */
struct DecadeSummary {
    DecadeBin bin;
    Estimator estimator = Estimator::kInvariant;
    StrikeStatistic statistic;
    CircularHistogram histogram;
    std::optional<core::Error> issue;
};

/**
 * @brief One station's statistics, one entry per decade of the report.
 */
struct StationRow {
    std::string stationId;
    std::vector<StrikeStatistic> perDecade;
};

/**
 * @brief Station by decade table of one estimator.
 */
struct StationTable {
    Estimator estimator = Estimator::kInvariant;
    std::vector<StationRow> rows;
};

/**
 * @brief Full output of an analysis run.
 *
 * summaries is decade-major: the entry of decade d and the i-th enabled
 * estimator sits at d * estimators.size() + i.
 */
struct StrikeReport {
    AnalysisConfig config;
    CanonicalGrid grid;
    std::vector<Estimator> estimators;
    std::vector<DecadeBin> decades;
    std::vector<DecadeSummary> summaries;
    std::vector<DecadeSummary> aggregate;
    std::vector<StationTable> stationTables;
    std::vector<AlignmentDiagnostics> diagnostics;
    std::vector<core::Error> issues;

    [[nodiscard]] const DecadeSummary *find(core::usize decade, Estimator estimator) const noexcept;
    [[nodiscard]] const DecadeSummary *aggregateFor(Estimator estimator) const noexcept;
    [[nodiscard]] const StationTable *stationTable(Estimator estimator) const noexcept;
};

/**
 * @brief Folded, aligned table of one estimator with its diagnostics.
 */
struct EstimatorInput {
    AlignedTable folded;
    std::vector<AlignmentDiagnostics> diagnostics;
};

class StatisticsReport final {
public:
    StatisticsReport() = delete;

    /**
     * @brief Histogram and statistic of one bin's samples.
     *
     * An empty sample set is not a failure: the summary carries a kEmptyBin
     * issue and undefined statistics.
     */
    [[nodiscard]] static core::Expected<DecadeSummary> summarize(
        const DecadeBin &bin,
        Estimator estimator,
        std::span<const double> samples,
        const AnalysisConfig &config);

    /**
     * @brief Station by decade statistics from each station's own samples.
     */
    [[nodiscard]] static core::Expected<StationTable> stationTable(
        std::span<const StationRecord> stations,
        Estimator estimator,
        const std::vector<DecadeBin> &decades,
        const AnalysisConfig &config);

    /**
     * @brief Builds the whole report from folded tables.
     *
     * @param inputs One entry per enabled estimator, in kAllEstimators order.
     */
    [[nodiscard]] static core::Expected<StrikeReport> assemble(
        const AnalysisConfig &config,
        const CanonicalGrid &grid,
        std::span<const StationRecord> stations,
        std::span<const EstimatorInput> inputs);
};

} // namespace mts::strike

#endif // MTS_STRIKE_STATISTICS_REPORT_HPP
