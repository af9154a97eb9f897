// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief MtStrike report entry-point.
///
/// Reads a long-format station CSV, runs the strike statistics engine and
/// writes the station, summary and rose-diagram tables.
// /////////////////////////////////////////////////////////////////////////////

#include <mts/core/Log.hpp>
#include <mts/io/ReportWriter.hpp>
#include <mts/io/StationCsvReader.hpp>
#include <mts/strike/AnalysisConfig.hpp>
#include <mts/strike/StrikeAnalysis.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

struct CliOptions {
    std::string input;
    std::string outDir = ".";
    mts::io::TableFormat format;
    mts::core::LogLevel logLevel = mts::core::LogLevel::kInfo;
};

void printUsage()
{
    std::cerr
        << "Usage: mts_strike_report --input stations.csv [--out-dir DIR]\n"
        << "Optional: --tolerance T (relative period tolerance, default 0.05)\n"
        << "Optional: --bin-width W (histogram bin width in degrees, default 5)\n"
        << "Optional: --fold folded|unfolded (default folded)\n"
        << "Optional: --decades auto|bmin,bmax (log10 period exponents)\n"
        << "Optional: --error-floor E (phase-tensor azimuth variance floor)\n"
        << "Optional: --mean arithmetic|vector (default arithmetic)\n"
        << "Optional: --estimators invariant,pt,tipper (default all)\n"
        << "Optional: --legacy-zero (treat folded 0.0 as missing)\n"
        << "Optional: --delimiter C --width N --precision N (text layout)\n"
        << "Optional: --log-level debug|info|warn|error (default info)\n"
        << "Optional: --verbose (same as --log-level debug)\n";
}

bool parseDouble(const std::string &text, double *out)
{
    try {
        std::size_t used = 0;
        *out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception &) {
        return false;
    }
}

bool parseInt(const std::string &text, int *out)
{
    try {
        std::size_t used = 0;
        *out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception &) {
        return false;
    }
}

bool parseArgs(int argc, char *argv[], CliOptions *cli, mts::strike::AnalysisConfig::Builder *builder)
{
    using mts::strike::Estimator;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto next = [&](std::string *value) {
            if (i + 1 >= argc)
                return false;
            *value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--verbose") {
            cli->logLevel = mts::core::LogLevel::kDebug;
        } else if (arg == "--legacy-zero") {
            builder->excludeExactZero(true);
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!next(&value)) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        } else if (arg == "--log-level") {
            const auto level = mts::core::parseLogLevel(value);
            if (!level) {
                std::cerr << "Unknown log level: " << value << "\n";
                return false;
            }
            cli->logLevel = *level;
        } else if (arg == "--input") {
            cli->input = value;
        } else if (arg == "--out-dir") {
            cli->outDir = value;
        } else if (arg == "--tolerance" || arg == "--bin-width" || arg == "--error-floor") {
            double v = 0.0;
            if (!parseDouble(value, &v)) {
                std::cerr << "Invalid number for " << arg << ": " << value << "\n";
                return false;
            }
            if (arg == "--tolerance")
                builder->tolerance(v);
            else if (arg == "--bin-width")
                builder->binWidth(v);
            else
                builder->errorFloor(v);
        } else if (arg == "--fold") {
            if (value == "folded") {
                builder->foldMode(mts::strike::FoldMode::kFolded);
            } else if (value == "unfolded") {
                builder->foldMode(mts::strike::FoldMode::kUnfolded);
            } else {
                std::cerr << "Unknown fold mode: " << value << "\n";
                return false;
            }
        } else if (arg == "--decades") {
            if (value == "auto") {
                builder->autoDecadeRange();
                continue;
            }
            const auto comma = value.find(',');
            int low = 0;
            int high = 0;
            if (comma == std::string::npos ||
                !parseInt(value.substr(0, comma), &low) ||
                !parseInt(value.substr(comma + 1), &high)) {
                std::cerr << "Invalid decade range: " << value << "\n";
                return false;
            }
            builder->decadeRange(low, high);
        } else if (arg == "--mean") {
            if (value == "arithmetic") {
                builder->meanMethod(mts::strike::MeanMethod::kArithmetic);
            } else if (value == "vector") {
                builder->meanMethod(mts::strike::MeanMethod::kVector);
            } else {
                std::cerr << "Unknown mean method: " << value << "\n";
                return false;
            }
        } else if (arg == "--estimators") {
            for (const auto e : mts::strike::kAllEstimators)
                builder->estimator(e, false);
            std::istringstream ss(value);
            std::string name;
            while (std::getline(ss, name, ',')) {
                const auto e = mts::strike::parseEstimator(name);
                if (!e) {
                    std::cerr << "Unknown estimator: " << name << "\n";
                    return false;
                }
                builder->estimator(*e, true);
            }
        } else if (arg == "--delimiter") {
            if (value.size() != 1) {
                std::cerr << "Delimiter must be a single character\n";
                return false;
            }
            cli->format.delimiter = value[0];
        } else if (arg == "--width" || arg == "--precision") {
            int v = 0;
            if (!parseInt(value, &v) || v < 0) {
                std::cerr << "Invalid value for " << arg << ": " << value << "\n";
                return false;
            }
            if (arg == "--width")
                cli->format.columnWidth = v;
            else
                cli->format.precision = v;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    return !cli->input.empty();
}

} // namespace

int main(int argc, char *argv[])
{
    CliOptions cli;
    mts::strike::AnalysisConfig::Builder builder;
    if (!parseArgs(argc, argv, &cli, &builder)) {
        printUsage();
        return EXIT_FAILURE;
    }

    mts::core::Log::setMinLevel(cli.logLevel);

    const auto config = builder.build();

    auto stations = mts::io::StationCsvReader({.filePath = cli.input}).read();
    if (!stations) {
        mts::core::Log::error("main", stations.error().format());
        return EXIT_FAILURE;
    }

    auto report = mts::strike::StrikeAnalysis::run(*stations, config);
    if (!report) {
        mts::core::Log::error("main", report.error().format());
        return EXIT_FAILURE;
    }

    auto written = mts::io::ReportWriter::writeAll(cli.outDir, *report, cli.format);
    if (!written) {
        mts::core::Log::error("main", written.error().format());
        return EXIT_FAILURE;
    }

    mts::core::Log::info("main", "done");
    return EXIT_SUCCESS;
}
