/**
 * @file StationCsvReader.cpp
 * @brief Implementation of the long-format station CSV reader.
 * @author MasterLaplace
 */

#include "mts/io/StationCsvReader.hpp"

#include <mts/core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace mts::io {

namespace {

constexpr std::size_t kMinColumns = 5;
constexpr std::size_t kMaxColumns = 6;

std::string trim(const std::string &s)
{
    const auto first = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::vector<std::string> split(const std::string &line, char delimiter)
{
    std::vector<std::string> out;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, delimiter))
        out.push_back(trim(token));
    if (!line.empty() && line.back() == delimiter)
        out.emplace_back();
    return out;
}

core::Expected<double> parseNumber(
    const std::string &token,
    bool allowUndefined,
    const std::string &where)
{
    if (allowUndefined) {
        std::string lower(token);
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.empty() || lower == "nan")
            return std::numeric_limits<double>::quiet_NaN();
    }

    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &used);
    } catch (const std::exception &) {
        used = 0;
    }

    if (used == 0 || used != token.size()) {
        return core::makeError(core::ErrorCode::kFileParseError,
            "Invalid numeric value '" + token + "' at " + where);
    }
    return value;
}

} // namespace

StationCsvReader::StationCsvReader(StationCsvConfig config)
    : _config(std::move(config))
{
}

core::Expected<std::vector<strike::StationRecord>> StationCsvReader::read() const
{
    std::ifstream file(_config.filePath);
    if (!file.is_open()) {
        return core::makeError(core::ErrorCode::kFileNotFound, _config.filePath);
    }
    return parse(file, _config.filePath, _config.delimiter, _config.hasHeader);
}

core::Expected<std::vector<strike::StationRecord>> StationCsvReader::parse(
    std::istream &in,
    const std::string &sourceName,
    char delimiter,
    bool hasHeader)
{
    std::vector<strike::StationData> stations;
    std::unordered_map<std::string, std::size_t> index;

    std::string line;
    std::size_t lineNo = 0;
    bool headerPending = hasHeader;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#' || line[0] == '%')
            continue;
        if (headerPending) {
            headerPending = false;
            continue;
        }

        const auto cells = split(line, delimiter);
        const std::string where = sourceName + ":" + std::to_string(lineNo);
        if (cells.size() < kMinColumns || cells.size() > kMaxColumns) {
            return core::makeError(core::ErrorCode::kFileParseError,
                "Expected 5 or 6 columns, got " + std::to_string(cells.size()) + " at " + where);
        }
        if (cells[0].empty()) {
            return core::makeError(core::ErrorCode::kFileParseError,
                "Missing station id at " + where);
        }

        const double period     = MTS_TRY(parseNumber(cells[1], false, where));
        const double invariant  = MTS_TRY(parseNumber(cells[2], true, where));
        const double ptAzimuth  = MTS_TRY(parseNumber(cells[3], true, where));
        const double tipper     = MTS_TRY(parseNumber(cells[4], true, where));

        auto [it, inserted] = index.try_emplace(cells[0], stations.size());
        if (inserted)
            stations.push_back(strike::StationData{.stationId = cells[0]});
        auto &data = stations[it->second];

        if (cells.size() == kMaxColumns && !data.ptAzimuthVariance) {
            data.ptAzimuthVariance = std::vector<double>(
                data.periods.size(), std::numeric_limits<double>::quiet_NaN());
        }

        data.periods.push_back(period);
        data.invariantAngle.push_back(invariant);
        data.ptAzimuth.push_back(ptAzimuth);
        data.tipperAngle.push_back(tipper);

        if (data.ptAzimuthVariance) {
            const double variance = cells.size() == kMaxColumns
                ? MTS_TRY(parseNumber(cells[5], true, where))
                : std::numeric_limits<double>::quiet_NaN();
            data.ptAzimuthVariance->push_back(variance);
        }
    }

    if (stations.empty()) {
        return core::makeError(core::ErrorCode::kInvalidInput,
            "No station rows in " + sourceName);
    }

    std::vector<strike::StationRecord> records;
    records.reserve(stations.size());
    for (auto &data : stations)
        records.push_back(MTS_TRY(strike::StationRecord::create(std::move(data))));

    core::Log::info("StationCsvReader",
        "loaded " + std::to_string(records.size()) + " stations from " + sourceName);

    return records;
}

} // namespace mts::io
