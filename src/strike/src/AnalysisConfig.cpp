// /////////////////////////////////////////////////////////////////////////////
/// @file AnalysisConfig.cpp
/// @brief AnalysisConfig::Builder implementation and validation.
// /////////////////////////////////////////////////////////////////////////////

#include <mts/strike/AnalysisConfig.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace mts::strike {

AnalysisConfig::Builder& AnalysisConfig::Builder::tolerance(core::f64 tau) noexcept
{
    tolerance_ = tau;
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::binWidth(core::f64 degrees) noexcept
{
    binWidth_ = degrees;
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::foldMode(FoldMode mode) noexcept
{
    foldMode_ = mode;
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::decadeRange(core::i32 low, core::i32 high) noexcept
{
    decadeRange_ = DecadeRange{low, high};
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::autoDecadeRange() noexcept
{
    decadeRange_.reset();
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::errorFloor(core::f64 degrees) noexcept
{
    errorFloor_ = degrees;
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::noErrorFloor() noexcept
{
    errorFloor_.reset();
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::meanMethod(MeanMethod method) noexcept
{
    meanMethod_ = method;
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::estimator(Estimator e, bool enabled) noexcept
{
    estimators_[estimatorIndex(e)] = enabled;
    return *this;
}

AnalysisConfig::Builder& AnalysisConfig::Builder::excludeExactZero(bool enabled) noexcept
{
    excludeExactZero_ = enabled;
    return *this;
}

AnalysisConfig AnalysisConfig::Builder::build() const noexcept
{
    AnalysisConfig cfg;
    cfg.tolerance_        = tolerance_;
    cfg.binWidth_         = binWidth_;
    cfg.foldMode_         = foldMode_;
    cfg.decadeRange_      = decadeRange_;
    cfg.errorFloor_       = errorFloor_;
    cfg.meanMethod_       = meanMethod_;
    cfg.estimators_       = estimators_;
    cfg.excludeExactZero_ = excludeExactZero_;
    return cfg;
}

core::ExpectedVoid AnalysisConfig::validate() const
{
    if (!(tolerance_ > 0.0 && tolerance_ < 1.0)) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "tolerance must lie in (0, 1), got " + std::to_string(tolerance_));
    }

    const core::f64 width = domainOf(foldMode_).width();
    if (!(binWidth_ > 0.0 && binWidth_ <= width)) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "bin width must lie in (0, " + std::to_string(width) + "], got " +
            std::to_string(binWidth_));
    }

    if (decadeRange_ &&
        (decadeRange_->low < core::kMinDecadeExponent || decadeRange_->high > core::kMaxDecadeExponent)) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "decade exponents must lie in [" + std::to_string(core::kMinDecadeExponent) + ", " +
            std::to_string(core::kMaxDecadeExponent) + "], got [" +
            std::to_string(decadeRange_->low) + ", " + std::to_string(decadeRange_->high) + ")");
    }

    if (decadeRange_ && decadeRange_->span() <= 0) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "decade range [" + std::to_string(decadeRange_->low) + ", " +
            std::to_string(decadeRange_->high) + ") is empty");
    }

    if (errorFloor_ && !(std::isfinite(*errorFloor_) && *errorFloor_ >= 0.0)) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "error floor must be a non-negative number");
    }

    if (std::none_of(estimators_.begin(), estimators_.end(), [](bool on) { return on; })) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "at least one estimator must be enabled");
    }

    return {};
}

} // namespace mts::strike
