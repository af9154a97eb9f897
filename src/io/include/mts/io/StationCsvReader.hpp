/**
 * @file StationCsvReader.hpp
 * @brief Loads MT soundings from a long-format CSV file.
 * @author MasterLaplace
 *
 * One sample per line:
 *
 * @code
 *   station,period,invariant,pt_azimuth,tipper[,pt_azimuth_variance]
 * @endcode
 *
 * Rows are grouped by station in order of first appearance; within a
 * station the row order is kept. Lines starting with '#' or '%' are
 * comments, empty lines are skipped. An empty angle cell or "nan" marks an
 * undefined estimate.
 *
 * @see StationRecord
 */

#pragma once

#ifndef MTS_IO_STATION_CSV_READER_HPP
    #define MTS_IO_STATION_CSV_READER_HPP

    #include <mts/core/Error.hpp>
    #include <mts/strike/StationRecord.hpp>

    #include <istream>
    #include <string>
    #include <vector>

namespace mts::io {

/**
 * @brief Configuration for a station CSV reader.
 */
struct StationCsvConfig {
    std::string filePath;
    char delimiter = ',';
    bool hasHeader = true;
};

class StationCsvReader final {
public:
    explicit StationCsvReader(StationCsvConfig config);

    /**
     * @brief Reads and validates every station of the configured file.
     */
    [[nodiscard]] core::Expected<std::vector<strike::StationRecord>> read() const;

    /**
     * @brief Parses CSV text from @p in; @p sourceName only labels errors.
     */
    [[nodiscard]] static core::Expected<std::vector<strike::StationRecord>> parse(
        std::istream &in,
        const std::string &sourceName,
        char delimiter = ',',
        bool hasHeader = true);

private:
    StationCsvConfig _config;
};

} // namespace mts::io

#endif // MTS_IO_STATION_CSV_READER_HPP
