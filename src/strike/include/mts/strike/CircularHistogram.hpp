/**
 * @file CircularHistogram.hpp
 * @brief Fixed-width angle histogram and the statistics derived from it.
 *
 * The histogram spans the active domain of the run's FoldMode: (-90, 90]
 * in folded mode, [0, 360) in unfolded mode. Its bin arrays are what a
 * rose-diagram renderer draws.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_STRIKE_CIRCULAR_HISTOGRAM_HPP
    #define MTS_STRIKE_CIRCULAR_HISTOGRAM_HPP

    #include <mts/core/Error.hpp>
    #include <mts/strike/Types.hpp>

    #include <span>
    #include <vector>

namespace mts::strike {

class CircularHistogram final {
public:
    CircularHistogram() = default;

    /**
     * @brief Counts @p samples into bins of @p binWidth degrees.
     *
     * Edges start at the low end of the domain; the last edge is clamped to
     * the high end when the width does not divide the domain. A value equal
     * to the high end lands in the last bin.
     *
     * @return The histogram, or kInvalidArgument when @p binWidth is not
     *         in (0, domain width].
     */
    [[nodiscard]] static core::Expected<CircularHistogram> build(
        std::span<const double> samples,
        double binWidth,
        FoldMode mode);

    /**
     * @brief Mean, median and mode of @p samples.
     *
     * The mode is the left edge of the fullest bin of @p histogram, the
     * lowest angle winning ties. Median is arithmetic on the folded values.
     * The mean follows @p method and is wrapped back into the domain.
     * Every angle field is NaN for an empty sample set.
     */
    [[nodiscard]] static StrikeStatistic statistic(
        std::span<const double> samples,
        const CircularHistogram &histogram,
        MeanMethod method = MeanMethod::kArithmetic);

    [[nodiscard]] static double median(std::span<const double> samples);
    [[nodiscard]] static double arithmeticMean(std::span<const double> samples) noexcept;
    [[nodiscard]] static double vectorMean(std::span<const double> samples, FoldMode mode) noexcept;

    [[nodiscard]] FoldMode foldMode() const noexcept { return _mode; }
    [[nodiscard]] double binWidth() const noexcept { return _binWidth; }
    [[nodiscard]] core::usize binCount() const noexcept { return _counts.size(); }

    /// @brief binCount() + 1 edges, ascending.
    [[nodiscard]] const std::vector<double> &edges() const noexcept { return _edges; }
    [[nodiscard]] const std::vector<core::usize> &counts() const noexcept { return _counts; }

    [[nodiscard]] core::usize total() const noexcept;
    [[nodiscard]] core::usize populatedBins() const noexcept;

    /**
     * @brief Index of the fullest bin, first on ties; binCount() when empty.
     */
    [[nodiscard]] core::usize modeBin() const noexcept;

    [[nodiscard]] core::usize binIndexOf(double angle) const noexcept;

private:
    FoldMode _mode = FoldMode::kFolded;
    double _binWidth = core::kDefaultBinWidthDeg;
    std::vector<double> _edges;
    std::vector<core::usize> _counts;
};

} // namespace mts::strike

#endif // MTS_STRIKE_CIRCULAR_HISTOGRAM_HPP
