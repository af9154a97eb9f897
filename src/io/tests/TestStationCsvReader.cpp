/**
 * @file TestStationCsvReader.cpp
 * @brief Unit tests for mts::io::StationCsvReader.
 */

#include <catch2/catch_test_macros.hpp>

#include "mts/io/StationCsvReader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace mts::io {

using strike::Estimator;

namespace {

class TempCsvFile {
public:
    explicit TempCsvFile(const std::string& content)
        : _path(std::filesystem::temp_directory_path() / "mts_station_test.csv")
    {
        std::ofstream ofs(_path);
        ofs << content;
    }

    ~TempCsvFile() { std::filesystem::remove(_path); }

    [[nodiscard]] std::string path() const { return _path.string(); }

private:
    std::filesystem::path _path;
};

core::Expected<std::vector<strike::StationRecord>> parseText(const std::string& text,
                                                            char delimiter = ',',
                                                            bool hasHeader = true)
{
    std::istringstream in(text);
    return StationCsvReader::parse(in, "inline.csv", delimiter, hasHeader);
}

} // namespace

TEST_CASE("StationCsvReader groups rows by station", "[io][csv]")
{
    TempCsvFile csv(
        "station,period,invariant,pt_azimuth,tipper\n"
        "mt01,1.0,10,20,30\n"
        "mt02,1.02,15,25,35\n"
        "mt01,10.0,11,21,31\n"
        "mt02,9.8,16,26,36\n");

    StationCsvReader reader(StationCsvConfig{.filePath = csv.path()});
    auto stations = reader.read();

    REQUIRE(stations.has_value());
    REQUIRE(stations->size() == 2);

    const auto& first = (*stations)[0];
    REQUIRE(first.stationId() == "mt01");
    REQUIRE(first.size() == 2);
    REQUIRE(first.periods()[1] == 10.0);
    REQUIRE(first.angles(Estimator::kInvariant)[1] == 11.0);
    REQUIRE(first.angles(Estimator::kPhaseTensor)[0] == 20.0);
    REQUIRE(first.angles(Estimator::kTipper)[0] == 30.0);
    REQUIRE_FALSE(first.hasPtVariance());

    REQUIRE((*stations)[1].stationId() == "mt02");
    REQUIRE((*stations)[1].periods()[0] == 1.02);
}

TEST_CASE("StationCsvReader skips comments and blank lines", "[io][csv]")
{
    auto stations = parseText(
        "# exported survey\n"
        "station,period,invariant,pt_azimuth,tipper\n"
        "\n"
        "% another comment\n"
        "a,1.0,10,20,30\r\n");

    REQUIRE(stations.has_value());
    REQUIRE(stations->size() == 1);
    REQUIRE(stations->front().size() == 1);
}

TEST_CASE("StationCsvReader reads missing angles as undefined", "[io][csv]")
{
    auto stations = parseText(
        "station,period,invariant,pt_azimuth,tipper\n"
        "a,1.0,10,NaN,\n"
        "a,2.0,nan,20,30\n");

    REQUIRE(stations.has_value());
    const auto& a = stations->front();
    REQUIRE(std::isnan(a.angles(Estimator::kPhaseTensor)[0]));
    REQUIRE(std::isnan(a.angles(Estimator::kTipper)[0]));
    REQUIRE(std::isnan(a.angles(Estimator::kInvariant)[1]));
    REQUIRE(a.angles(Estimator::kTipper)[1] == 30.0);
}

TEST_CASE("StationCsvReader reads the optional variance column", "[io][csv]")
{
    auto stations = parseText(
        "a,1.0,10,20,30\n"
        "a,2.0,10,20,30,4.5\n",
        ',', false);

    REQUIRE(stations.has_value());
    const auto& a = stations->front();
    REQUIRE(a.hasPtVariance());
    REQUIRE(a.ptAzimuthVariance().size() == 2);
    REQUIRE(std::isnan(a.ptAzimuthVariance()[0]));
    REQUIRE(a.ptAzimuthVariance()[1] == 4.5);
}

TEST_CASE("StationCsvReader honours a custom delimiter", "[io][csv]")
{
    auto stations = parseText("a;1.0;10;20;30\nb;3.0;10;20;30\n", ';', false);

    REQUIRE(stations.has_value());
    REQUIRE(stations->size() == 2);
    REQUIRE((*stations)[1].periods()[0] == 3.0);
}

TEST_CASE("StationCsvReader reports malformed input", "[io][csv]")
{
    SECTION("missing file")
    {
        StationCsvReader reader(StationCsvConfig{.filePath = "/nonexistent/stations.csv"});
        auto stations = reader.read();
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kFileNotFound);
    }

    SECTION("wrong column count")
    {
        auto stations = parseText("station,period\na,1.0,10\n");
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kFileParseError);
        REQUIRE(stations.error().message().find("inline.csv:2") != std::string::npos);
    }

    SECTION("non-numeric period")
    {
        auto stations = parseText("a,1.0x,10,20,30\n", ',', false);
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kFileParseError);
    }

    SECTION("empty period")
    {
        auto stations = parseText("a,,10,20,30\n", ',', false);
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kFileParseError);
    }

    SECTION("missing station id")
    {
        auto stations = parseText(",1.0,10,20,30\n", ',', false);
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kFileParseError);
    }

    SECTION("header only")
    {
        auto stations = parseText("station,period,invariant,pt_azimuth,tipper\n");
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kInvalidInput);
    }

    SECTION("non-positive period")
    {
        auto stations = parseText("a,-1.0,10,20,30\n", ',', false);
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kInvalidInput);
    }

    SECTION("infinite angle")
    {
        auto stations = parseText("A,1,-inf,10,10\n", ',', false);
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kInvalidInput);
    }

    SECTION("infinite variance")
    {
        auto stations = parseText("A,1,5,10,10,inf\n", ',', false);
        REQUIRE_FALSE(stations.has_value());
        REQUIRE(stations.error().code() == core::ErrorCode::kInvalidInput);
    }
}

} // namespace mts::io
