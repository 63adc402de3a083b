#pragma once

/// @file include/tsig/engine.hpp
/// @brief Analysis Engine: public entry point of the tsig pipeline.
///
/// # Module: Analysis Engine
///
/// ## Responsibility
/// Orchestrate one evaluation:
///   ActivitySummary (+ StreamSet) → CadenceNormalizer → StreamPreprocessor →
///   SplitBuilder → MetricsCalculator + IntervalDetector → Classifier →
///   effort score → FlagGenerator → ConfidenceEstimator → RiskScorer →
///   DerivedMetrics
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// AnalysisRequest req{.summary = summary, .streams = streams};
/// auto metrics = engine.analyze(req);
/// fmt::print("{}", metrics.to_string());
/// ```
///
/// ## Guarantees
/// - Deterministic: identical requests give equal DerivedMetrics
/// - Stateless: `analyze` is const and safe to call concurrently
/// - Fatal input problems throw `ValidationError`; everything else degrades
///   to null metrics with a recorded `DataGap`

#include "tsig/derived.hpp"
#include "tsig/streams.hpp"
#include "tsig/thresholds.hpp"
#include "tsig/types.hpp"

#include <optional>
#include <span>

namespace tsig::core {

// ─── AnalysisRequest ──────────────────────────────────────────────────────────

/// Everything the caller knows about one activity.
struct AnalysisRequest {
    ActivitySummary                summary;
    std::optional<StreamSet>       streams;
    UserProfile                    profile;
    std::optional<HistoryBaseline> baseline;
    std::optional<CheckIn>         check_in;
    bool                           race_declared = false;  ///< External race marker
};

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for the analysis engine.
struct EngineConfig {
    /// Every heuristic threshold; defaults to the named constants.
    Thresholds thresholds{};

    /// If true, emit per-stage trace lines to stderr.
    bool verbose = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// Construct with optional configuration.
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Evaluate one activity.
    ///
    /// # Pipeline
    /// 1. Validate the request.
    /// 2. Normalize cadence and prepare streams (fewer than two usable
    ///    samples count as no streams).
    /// 3. Build splits; compute zones, variability, drift, efficiency, stops
    ///    and interval structure.
    /// 4. Estimate preliminary confidence from coverage.
    /// 5. Classify; compute the effort score.
    /// 6. Evaluate flags; finalize confidence; score risk.
    ///
    /// # Throws
    /// `ValidationError` if the request is structurally invalid.
    [[nodiscard]] DerivedMetrics analyze(const AnalysisRequest& request) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// Check every fatal precondition of `analyze`.
    ///
    /// # Throws
    /// `ValidationError` naming the offending field.
    static void validate(const AnalysisRequest& request, const Thresholds& th = Thresholds{});

private:
    /// Stream-split time at or faster than the baseline threshold pace.
    [[nodiscard]] static std::optional<double>
    time_at_threshold_pace(std::span<const Split> splits,
                           const std::optional<HistoryBaseline>& baseline) noexcept;

    EngineConfig config_;
};

}  // namespace tsig::core
