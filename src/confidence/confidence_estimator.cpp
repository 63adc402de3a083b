/// @file src/confidence/confidence_estimator.cpp
/// @brief ConfidenceEstimator implementation.

#include "tsig/confidence.hpp"

namespace tsig::confidence {

Coverage
ConfidenceEstimator::coverage(const std::optional<preprocess::PreparedStreams>& streams,
                              const ActivitySummary& summary,
                              const std::optional<HistoryBaseline>& baseline,
                              const std::optional<CheckIn>& check_in) noexcept {
    Coverage cov;
    cov.has_streams   = streams.has_value();
    cov.has_hr_stream = streams && streams->has_data(Channel::HeartRate);
    cov.has_any_hr    = cov.has_hr_stream || summary.avg_hr.has_value();
    cov.has_gps       = streams && streams->has_data(Channel::Latitude) &&
                        streams->has_data(Channel::Longitude);
    if (baseline) {
        cov.baseline = baseline->is_thin() ? BaselineState::Thin : BaselineState::Sufficient;
    }
    cov.has_check_in = check_in.has_value();
    return cov;
}

Confidence ConfidenceEstimator::preliminary(const Coverage& cov) noexcept {
    if (!cov.has_streams || cov.baseline != BaselineState::Sufficient) {
        return Confidence::Low;
    }
    return cov.has_hr_stream ? Confidence::High : Confidence::Medium;
}

std::vector<std::string> ConfidenceEstimator::coverage_reasons(const Coverage& cov) {
    std::vector<std::string> reasons;
    if (!cov.has_streams) {
        reasons.emplace_back("no_stream_data");
    } else if (!cov.has_hr_stream) {
        reasons.emplace_back("no_heart_rate_stream");
    }
    if (!cov.has_any_hr) {
        reasons.emplace_back("no_heart_rate_data");
    }
    if (cov.has_streams && !cov.has_gps) {
        reasons.emplace_back("no_gps_data");
    }
    switch (cov.baseline) {
        case BaselineState::Absent: reasons.emplace_back("no_baseline");   break;
        case BaselineState::Thin:   reasons.emplace_back("thin_baseline"); break;
        case BaselineState::Sufficient: break;
    }
    if (!cov.has_check_in) {
        reasons.emplace_back("no_user_checkin");
    }
    return reasons;
}

Assessment
ConfidenceEstimator::finalize(const Coverage& cov,
                              const classify::ClassificationResult& classification,
                              std::span<const Flag> raised) {
    Assessment out{.level = preliminary(cov), .reasons = coverage_reasons(cov)};

    for (const Flag f : raised) {
        if (f == Flag::DataLowConfidenceHr || f == Flag::GpsLowConfidence) {
            out.reasons.emplace_back(to_string(f));
            if (out.level == Confidence::High) {
                out.level = Confidence::Medium;
            }
        }
    }

    if (classification.force_low_confidence) {
        out.level = Confidence::Low;
        out.reasons.emplace_back(cov.has_streams ? "borderline_classification"
                                                 : "summary_only_classification");
    }
    return out;
}

}  // namespace tsig::confidence
