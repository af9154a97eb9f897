/**
 * @file ReportWriter.cpp
 * @brief Implementation of the text table writers.
 * @author MasterLaplace
 */

#include "mts/io/ReportWriter.hpp"

#include <mts/core/Log.hpp>

#include <cmath>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace mts::io {

namespace {

void cell(std::ostream &out, const std::string &text, const TableFormat &format, bool first)
{
    if (!first)
        out << format.delimiter;
    out << std::setw(format.columnWidth) << text;
}

core::ExpectedVoid writeFile(
    const std::filesystem::path &path,
    const std::function<void(std::ostream &)> &body)
{
    std::ofstream file(path);
    if (!file.is_open()) {
        return core::makeError(core::ErrorCode::kIoError,
            "cannot open " + path.string() + " for writing");
    }
    body(file);
    if (!file) {
        return core::makeError(core::ErrorCode::kIoError,
            "write failed on " + path.string());
    }
    core::Log::info("ReportWriter", "wrote " + path.string());
    return {};
}

} // namespace

std::string ReportWriter::formatAngle(double value, int precision)
{
    if (std::isnan(value))
        return "nan";
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

std::string ReportWriter::formatTriple(const strike::StrikeStatistic &stat, int precision)
{
    return formatAngle(stat.mean, precision) + "/" +
           formatAngle(stat.median, precision) + "/" +
           formatAngle(stat.mode, precision);
}

void ReportWriter::writeStationTable(
    std::ostream &out,
    const strike::StrikeReport &report,
    strike::Estimator estimator,
    const TableFormat &format)
{
    const auto *table = report.stationTable(estimator);
    if (table == nullptr)
        return;

    cell(out, "station", format, true);
    for (const auto &bin : report.decades)
        cell(out, bin.label(), format, false);
    out << '\n';

    for (const auto &row : table->rows) {
        cell(out, row.stationId, format, true);
        for (const auto &stat : row.perDecade)
            cell(out, formatTriple(stat, format.precision), format, false);
        out << '\n';
    }
}

void ReportWriter::writeDecadeSummary(
    std::ostream &out,
    const strike::StrikeReport &report,
    const TableFormat &format)
{
    cell(out, "decade", format, true);
    cell(out, "estimator", format, false);
    cell(out, "count", format, false);
    cell(out, "mean", format, false);
    cell(out, "median", format, false);
    cell(out, "mode", format, false);
    out << '\n';

    auto line = [&](const strike::DecadeSummary &s, const std::string &label) {
        cell(out, label, format, true);
        cell(out, std::string(strike::estimatorName(s.estimator)), format, false);
        cell(out, std::to_string(s.statistic.sampleCount), format, false);
        cell(out, formatAngle(s.statistic.mean, format.precision), format, false);
        cell(out, formatAngle(s.statistic.median, format.precision), format, false);
        cell(out, formatAngle(s.statistic.mode, format.precision), format, false);
        out << '\n';
    };

    for (const auto &s : report.summaries)
        line(s, s.bin.label());
    for (const auto &s : report.aggregate)
        line(s, "all " + s.bin.label());
}

void ReportWriter::writeRoseData(
    std::ostream &out,
    const strike::StrikeReport &report,
    const TableFormat &format)
{
    cell(out, "decade", format, true);
    cell(out, "estimator", format, false);
    cell(out, "bin_low", format, false);
    cell(out, "bin_high", format, false);
    cell(out, "count", format, false);
    out << '\n';

    auto bins = [&](const strike::DecadeSummary &s, const std::string &label) {
        const auto &edges  = s.histogram.edges();
        const auto &counts = s.histogram.counts();
        for (std::size_t k = 0; k < counts.size(); ++k) {
            cell(out, label, format, true);
            cell(out, std::string(strike::estimatorName(s.estimator)), format, false);
            cell(out, formatAngle(edges[k], format.precision), format, false);
            cell(out, formatAngle(edges[k + 1], format.precision), format, false);
            cell(out, std::to_string(counts[k]), format, false);
            out << '\n';
        }
    };

    for (const auto &s : report.summaries)
        bins(s, s.bin.label());
    for (const auto &s : report.aggregate)
        bins(s, "all " + s.bin.label());
}

core::ExpectedVoid ReportWriter::writeAll(
    const std::filesystem::path &directory,
    const strike::StrikeReport &report,
    const TableFormat &format)
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return core::makeError(core::ErrorCode::kIoError,
            "cannot create " + directory.string() + ": " + ec.message());
    }

    for (const auto estimator : report.estimators) {
        const auto path = directory / ("strike_" + std::string(strike::estimatorName(estimator)) + ".txt");
        MTS_TRY_VOID(writeFile(path, [&](std::ostream &out) {
            writeStationTable(out, report, estimator, format);
        }));
    }

    MTS_TRY_VOID(writeFile(directory / "strike_summary.txt", [&](std::ostream &out) {
        writeDecadeSummary(out, report, format);
    }));

    MTS_TRY_VOID(writeFile(directory / "strike_rose.txt", [&](std::ostream &out) {
        writeRoseData(out, report, format);
    }));

    return {};
}

} // namespace mts::io
