/**
 * @file StrikeAnalysis.cpp
 * @brief Pipeline wiring of the strike statistics engine.
 * @author MasterLaplace
 */

#include "mts/strike/StrikeAnalysis.hpp"

#include <mts/core/Log.hpp>
#include <mts/strike/AngleFolder.hpp>
#include <mts/strike/PeriodAligner.hpp>
#include <mts/strike/PeriodGrid.hpp>

#include <vector>

namespace mts::strike {

core::Expected<StrikeReport> StrikeAnalysis::run(
    std::span<const StationRecord> stations,
    const AnalysisConfig &config)
{
    MTS_TRY_VOID(config.validate());

    core::Log::info("StrikeAnalysis",
        "analysing " + std::to_string(stations.size()) + " stations (" +
        std::string(foldModeName(config.foldMode())) + ")");

    const CanonicalGrid grid = MTS_TRY(PeriodGrid::build(stations));

    const AlignOptions options{
        .tolerance = config.tolerance(),
        .errorFloor = config.errorFloor(),
    };

    std::vector<EstimatorInput> inputs;
    for (const Estimator estimator : kAllEstimators) {
        if (!config.enabled(estimator))
            continue;

        auto aligned = MTS_TRY(PeriodAligner::align(grid, stations, estimator, options));
        if (core::Log::enabled(core::LogLevel::kDebug)) {
            for (const auto &diag : aligned.diagnostics) {
                core::Log::debug("StrikeAnalysis",
                    diag.stationId + " " + std::string(estimatorName(estimator)) + ": " +
                    std::to_string(diag.samplesMatched) + "/" + std::to_string(diag.samplesTotal) +
                    " samples matched");
            }
        }

        inputs.push_back(EstimatorInput{
            .folded = AngleFolder::foldTable(std::move(aligned.table), config.foldMode()),
            .diagnostics = std::move(aligned.diagnostics),
        });
    }

    auto report = MTS_TRY(StatisticsReport::assemble(config, grid, stations, inputs));

    core::Log::info("StrikeAnalysis",
        std::to_string(report.decades.size()) + " decades, " +
        std::to_string(report.issues.size()) + " empty bins");

    return report;
}

} // namespace mts::strike
