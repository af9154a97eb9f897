/**
 * @file StrikeAnalysis.hpp
 * @brief End-to-end strike statistics pipeline.
 * @author MasterLaplace
 *
 * Chains the pipeline stages as pure functions over explicit values:
 *
 * @code
 *   CanonicalGrid -> AlignedTable -> folded AlignedTable
 *                 -> DecadeBin rows -> CircularHistogram -> StrikeReport
 * @endcode
 *
 * No state survives between calls: the same stations and configuration
 * always give the same report.
 *
 * @see AnalysisConfig, StatisticsReport
 */

#pragma once

#ifndef MTS_STRIKE_STRIKE_ANALYSIS_HPP
    #define MTS_STRIKE_STRIKE_ANALYSIS_HPP

    #include <mts/core/Error.hpp>
    #include <mts/strike/AnalysisConfig.hpp>
    #include <mts/strike/StationRecord.hpp>
    #include <mts/strike/StatisticsReport.hpp>

    #include <span>

namespace mts::strike {

class StrikeAnalysis final {
public:
    StrikeAnalysis() = delete;

    /**
     * @brief Runs one analysis over @p stations.
     *
     * @return The report, or the first fatal error: kInvalidArgument for a
     *         bad configuration, kInvalidInput for an empty station set.
     *         Empty bins are reported inside the report, not here.
     */
    [[nodiscard]] static core::Expected<StrikeReport> run(
        std::span<const StationRecord> stations,
        const AnalysisConfig &config);
};

} // namespace mts::strike

#endif // MTS_STRIKE_STRIKE_ANALYSIS_HPP
