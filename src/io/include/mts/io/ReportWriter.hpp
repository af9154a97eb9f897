/**
 * @file ReportWriter.hpp
 * @brief Fixed-width delimited text export of a StrikeReport.
 * @author MasterLaplace
 *
 * Three tables are produced:
 *  - station table, one per estimator: station id, then one column per
 *    decade holding "mean/median/mode";
 *  - decade summary: one line per (decade, estimator), aggregate last;
 *  - rose data: one line per histogram bin, for polar bar-chart renderers.
 *
 * Undefined statistics are written as "nan".
 */

#pragma once

#ifndef MTS_IO_REPORT_WRITER_HPP
    #define MTS_IO_REPORT_WRITER_HPP

    #include <mts/core/Error.hpp>
    #include <mts/strike/StatisticsReport.hpp>

    #include <filesystem>
    #include <ostream>
    #include <string>

namespace mts::io {

/**
 * @brief Layout of the written tables.
 */
struct TableFormat {
    char delimiter = ',';
    int columnWidth = 20;
    int precision = 1;
};

class ReportWriter final {
public:
    ReportWriter() = delete;

    static void writeStationTable(
        std::ostream &out,
        const strike::StrikeReport &report,
        strike::Estimator estimator,
        const TableFormat &format = {});

    static void writeDecadeSummary(
        std::ostream &out,
        const strike::StrikeReport &report,
        const TableFormat &format = {});

    static void writeRoseData(
        std::ostream &out,
        const strike::StrikeReport &report,
        const TableFormat &format = {});

    /**
     * @brief Writes strike_<estimator>.txt, strike_summary.txt and
     *        strike_rose.txt into @p directory, creating it when missing.
     */
    [[nodiscard]] static core::ExpectedVoid writeAll(
        const std::filesystem::path &directory,
        const strike::StrikeReport &report,
        const TableFormat &format = {});

    /**
     * @brief "mean/median/mode" with @p precision decimals.
     */
    [[nodiscard]] static std::string formatTriple(
        const strike::StrikeStatistic &stat,
        int precision);

    [[nodiscard]] static std::string formatAngle(double value, int precision);
};

} // namespace mts::io

#endif // MTS_IO_REPORT_WRITER_HPP
