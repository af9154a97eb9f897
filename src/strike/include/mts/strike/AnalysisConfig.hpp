// /////////////////////////////////////////////////////////////////////////////
/// @file AnalysisConfig.hpp
/// @brief Strike analysis run configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises every tuneable parameter of one analysis run.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mts/core/Constants.hpp>
#include <mts/core/Error.hpp>
#include <mts/core/Types.hpp>
#include <mts/strike/Types.hpp>

#include <array>
#include <optional>

namespace mts::strike {

/// @brief Immutable analysis configuration.
class AnalysisConfig
{
public:
    /// @brief Fluent builder for AnalysisConfig.
    class Builder
    {
    public:
        Builder& tolerance(core::f64 tau) noexcept;
        Builder& binWidth(core::f64 degrees) noexcept;
        Builder& foldMode(FoldMode mode) noexcept;
        Builder& decadeRange(core::i32 low, core::i32 high) noexcept;
        Builder& autoDecadeRange() noexcept;
        Builder& errorFloor(core::f64 degrees) noexcept;
        Builder& noErrorFloor() noexcept;
        Builder& meanMethod(MeanMethod method) noexcept;
        Builder& estimator(Estimator e, bool enabled) noexcept;
        Builder& excludeExactZero(bool enabled) noexcept;

        [[nodiscard]] AnalysisConfig build() const noexcept;

    private:
        core::f64 tolerance_{core::kDefaultPeriodTolerance};
        core::f64 binWidth_{core::kDefaultBinWidthDeg};
        FoldMode foldMode_{FoldMode::kFolded};
        std::optional<DecadeRange> decadeRange_{};
        std::optional<core::f64> errorFloor_{};
        MeanMethod meanMethod_{MeanMethod::kArithmetic};
        std::array<bool, core::kEstimatorCount> estimators_{true, true, true};
        bool excludeExactZero_{false};
    };

    [[nodiscard]] core::f64 tolerance() const noexcept { return tolerance_; }
    [[nodiscard]] core::f64 binWidth()  const noexcept { return binWidth_; }
    [[nodiscard]] FoldMode  foldMode()  const noexcept { return foldMode_; }
    [[nodiscard]] const std::optional<DecadeRange>& decadeRange() const noexcept { return decadeRange_; }
    [[nodiscard]] const std::optional<core::f64>& errorFloor() const noexcept { return errorFloor_; }
    [[nodiscard]] MeanMethod meanMethod() const noexcept { return meanMethod_; }
    [[nodiscard]] bool excludeExactZero() const noexcept { return excludeExactZero_; }

    [[nodiscard]] bool enabled(Estimator e) const noexcept
    {
        return estimators_[estimatorIndex(e)];
    }

    /// @brief Checks every field against its admissible range.
    /// @return kInvalidArgument naming the first offending field.
    [[nodiscard]] core::ExpectedVoid validate() const;

private:
    friend class Builder;

    core::f64 tolerance_{core::kDefaultPeriodTolerance};
    core::f64 binWidth_{core::kDefaultBinWidthDeg};
    FoldMode foldMode_{FoldMode::kFolded};
    std::optional<DecadeRange> decadeRange_{};
    std::optional<core::f64> errorFloor_{};
    MeanMethod meanMethod_{MeanMethod::kArithmetic};
    std::array<bool, core::kEstimatorCount> estimators_{true, true, true};
    bool excludeExactZero_{false};
};

} // namespace mts::strike
