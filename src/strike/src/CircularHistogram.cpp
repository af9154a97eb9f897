/**
 * @file CircularHistogram.cpp
 * @brief Histogram construction and circular descriptive statistics.
 * @author MasterLaplace
 */

#include "mts/strike/CircularHistogram.hpp"

#include <mts/core/Assert.hpp>
#include <mts/core/Constants.hpp>
#include <mts/strike/AngleFolder.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>

namespace mts::strike {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kRadToDeg = 180.0 / std::numbers::pi;

} // namespace

core::Expected<CircularHistogram> CircularHistogram::build(
    std::span<const double> samples,
    double binWidth,
    FoldMode mode)
{
    const AngularDomain domain = domainOf(mode);
    if (!(binWidth > 0.0 && binWidth <= domain.width())) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "bin width must lie in (0, " + std::to_string(domain.width()) +
            "], got " + std::to_string(binWidth));
    }

    CircularHistogram h;
    h._mode = mode;
    h._binWidth = binWidth;

    const auto bins = static_cast<core::usize>(
        std::ceil(domain.width() / binWidth - core::kBinCountEps));

    h._edges.reserve(bins + 1);
    for (core::usize k = 0; k < bins; ++k)
        h._edges.push_back(domain.low + binWidth * static_cast<double>(k));
    h._edges.push_back(domain.high);
    h._counts.assign(bins, 0);

    for (const double s : samples) {
        MTS_ASSERT(s >= domain.low && s <= domain.high);
        ++h._counts[h.binIndexOf(s)];
    }

    return h;
}

core::usize CircularHistogram::binIndexOf(double angle) const noexcept
{
    if (_counts.empty())
        return 0;
    const double low = domainOf(_mode).low;
    const double k = std::floor((angle - low) / _binWidth);
    if (!(k > 0.0))
        return 0;
    const auto last = _counts.size() - 1;
    if (k >= static_cast<double>(last))
        return last;
    return static_cast<core::usize>(k);
}

core::usize CircularHistogram::total() const noexcept
{
    return std::accumulate(_counts.begin(), _counts.end(), core::usize{0});
}

core::usize CircularHistogram::populatedBins() const noexcept
{
    return static_cast<core::usize>(
        std::count_if(_counts.begin(), _counts.end(), [](core::usize c) { return c > 0; }));
}

core::usize CircularHistogram::modeBin() const noexcept
{
    core::usize best = _counts.size();
    core::usize bestCount = 0;
    for (core::usize k = 0; k < _counts.size(); ++k) {
        if (_counts[k] > bestCount) {
            best = k;
            bestCount = _counts[k];
        }
    }
    return best;
}

double CircularHistogram::median(std::span<const double> samples)
{
    if (samples.empty())
        return kUndefined;

    std::vector<double> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());

    const core::usize n = sorted.size();
    if (n % 2 == 1)
        return sorted[n / 2];
    return 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
}

double CircularHistogram::arithmeticMean(std::span<const double> samples) noexcept
{
    if (samples.empty())
        return kUndefined;
    return std::accumulate(samples.begin(), samples.end(), 0.0) /
           static_cast<double>(samples.size());
}

double CircularHistogram::vectorMean(std::span<const double> samples, FoldMode mode) noexcept
{
    if (samples.empty())
        return kUndefined;

    // Axial data: double the angles so that x and x + 180 coincide.
    const double factor = mode == FoldMode::kFolded ? 2.0 : 1.0;

    double sumSin = 0.0;
    double sumCos = 0.0;
    for (const double s : samples) {
        sumSin += std::sin(factor * s * kDegToRad);
        sumCos += std::cos(factor * s * kDegToRad);
    }

    const double resultant = std::hypot(sumSin, sumCos) / static_cast<double>(samples.size());
    if (resultant < core::kResultantEps)
        return kUndefined;

    const double mean = std::atan2(sumSin, sumCos) * kRadToDeg / factor;
    return AngleFolder::wrap(mean, mode);
}

StrikeStatistic CircularHistogram::statistic(
    std::span<const double> samples,
    const CircularHistogram &histogram,
    MeanMethod method)
{
    StrikeStatistic stat;
    stat.sampleCount = samples.size();
    if (samples.empty())
        return stat;

    stat.mean = method == MeanMethod::kVector
        ? vectorMean(samples, histogram.foldMode())
        : AngleFolder::wrap(arithmeticMean(samples), histogram.foldMode());
    stat.median = median(samples);

    const core::usize k = histogram.modeBin();
    if (k < histogram.binCount())
        stat.mode = histogram.edges()[k];

    return stat;
}

} // namespace mts::strike
