/**
 * @file AngleFolder.cpp
 * @brief Implementation of the strike angle folding conventions.
 * @author MasterLaplace
 */

#include "mts/strike/AngleFolder.hpp"

#include <mts/core/Constants.hpp>

#include <cmath>

namespace mts::strike {

double AngleFolder::toClockwiseFromNorth(double raw, Estimator estimator) noexcept
{
    switch (estimator) {
        case Estimator::kInvariant:
        case Estimator::kPhaseTensor:
            return core::kStrikeOffsetDeg - raw;
        case Estimator::kTipper:
            return -raw;
    }
    return raw;
}

double AngleFolder::wrap(double angle, FoldMode mode) noexcept
{
    if (!std::isfinite(angle))
        return angle;

    if (mode == FoldMode::kFolded) {
        double a = std::fmod(angle, 180.0);
        if (a > core::kFoldedDomainHigh)
            a -= 180.0;
        else if (a <= core::kFoldedDomainLow)
            a += 180.0;
        return a + 0.0;
    }

    double a = std::fmod(angle, 360.0);
    if (a < 0.0)
        a += 360.0;
    // -1e-17 + 360 rounds to 360.
    if (a >= core::kUnfoldedDomainHigh)
        a -= 360.0;
    return a + 0.0;
}

double AngleFolder::fold(double raw, Estimator estimator, FoldMode mode) noexcept
{
    return wrap(toClockwiseFromNorth(raw, estimator), mode);
}

AlignedTable AngleFolder::foldTable(AlignedTable table, FoldMode mode)
{
    const Estimator estimator = table.estimator();
    table.transform([estimator, mode](double raw) { return fold(raw, estimator, mode); });
    return table;
}

} // namespace mts::strike
