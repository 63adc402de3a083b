#pragma once

/// @file include/tsig/confidence.hpp
/// @brief ConfidenceEstimator: overall reliability of one evaluation.
///
/// # Module: Confidence Estimator
///
/// ## Responsibility
/// Summarise data coverage into a `Confidence` level plus machine-readable
/// reasons. The estimate is made twice: a preliminary level from coverage
/// alone (consumed by the classifier and the flag generator), and a final
/// level once the classification and the flags are known.
///
/// ## Levels
/// | Level  | Condition                                                    |
/// |--------|--------------------------------------------------------------|
/// | High   | streams with HR, sufficient baseline, no low-confidence flag |
/// | Low    | summary only, absent or thin baseline, or forced low         |
/// | Medium | otherwise                                                    |
///
/// ## Reasons
/// `no_stream_data`, `no_heart_rate_stream`, `no_heart_rate_data`,
/// `no_gps_data`, `no_baseline`, `thin_baseline`, `no_user_checkin`,
/// `summary_only_classification`, `borderline_classification`, and the
/// name of any raised low-confidence flag.

#include "tsig/classifier.hpp"
#include "tsig/derived.hpp"
#include "tsig/preprocess.hpp"
#include "tsig/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tsig::confidence {

enum class BaselineState {
    Absent,
    Thin,
    Sufficient,
};

/// What data the evaluation had to work with.
struct Coverage {
    bool          has_streams   = false;
    bool          has_hr_stream = false;
    bool          has_any_hr    = false;  ///< HR stream or summary average
    bool          has_gps       = false;  ///< Latitude and longitude samples
    BaselineState baseline      = BaselineState::Absent;
    bool          has_check_in  = false;

    bool operator==(const Coverage&) const = default;
};

struct Assessment {
    Confidence               level = Confidence::Low;
    std::vector<std::string> reasons;

    bool operator==(const Assessment&) const = default;
};

class ConfidenceEstimator {
public:
    [[nodiscard]] static Coverage
    coverage(const std::optional<preprocess::PreparedStreams>& streams,
             const ActivitySummary& summary,
             const std::optional<HistoryBaseline>& baseline,
             const std::optional<CheckIn>& check_in) noexcept;

    /// Level from coverage alone.
    [[nodiscard]] static Confidence preliminary(const Coverage& cov) noexcept;

    /// Coverage reasons, in fixed order.
    [[nodiscard]] static std::vector<std::string> coverage_reasons(const Coverage& cov);

    /// Final level and reasons.
    ///
    /// A classifier-forced Low wins over everything. A raised
    /// data_low_confidence_hr or gps_low_confidence caps the level at Medium.
    [[nodiscard]] static Assessment
    finalize(const Coverage& cov,
             const classify::ClassificationResult& classification,
             std::span<const Flag> raised);
};

}  // namespace tsig::confidence
