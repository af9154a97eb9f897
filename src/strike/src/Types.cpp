/**
 * @file Types.cpp
 * @brief Parsing and labelling helpers for the strike vocabulary types.
 * @author MasterLaplace
 */

#include "mts/strike/Types.hpp"

#include <cstdio>

namespace mts::strike {

std::optional<Estimator> parseEstimator(std::string_view name) noexcept
{
    if (name == "invariant" || name == "inv")
        return Estimator::kInvariant;
    if (name == "pt" || name == "pt_azimuth")
        return Estimator::kPhaseTensor;
    if (name == "tipper" || name == "tip")
        return Estimator::kTipper;
    return std::nullopt;
}

std::string DecadeBin::label() const
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%g-%gs", periodLow(), periodHigh());
    return buf;
}

} // namespace mts::strike
