#pragma once

/// @file include/tsig/errors.hpp
/// @brief Error and data-gap vocabulary shared by every tsig module.
///
/// # Two kinds of outcome
/// - `ValidationError` (fatal): structurally invalid required input. Thrown
///   by `core::Engine::analyze`; the evaluation aborts.
/// - `DataGap` (non-fatal): an expected signal is missing or insufficient.
///   The affected metric is left null and carries the gap as its reason.
///
/// `Nullable<T>` is the value type for every optional derived quantity: it
/// holds either a concrete value or the `DataGap` explaining its absence.
/// There is no third state and no sentinel number.

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tsig {

// ─── ValidationError ──────────────────────────────────────────────────────────

/// Structurally invalid required input (e.g. non-positive moving time,
/// misaligned stream channels).
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// ─── DataGap ──────────────────────────────────────────────────────────────────

/// Reason a derived value is absent.
enum class DataGap {
    NoStreams,            ///< No stream set supplied
    NoHeartRate,          ///< No usable heart-rate data (stream or summary)
    NoVelocity,           ///< No velocity or distance-derived velocity
    NoDistance,           ///< No reliable distance data
    NoGrade,              ///< No grade or per-split grade data
    InsufficientSamples,  ///< Channel present but too sparse or short
    NoSteadyState,        ///< Longest steady-state segment below minimum
    NoSplits,             ///< No splits could be built
    NoIntervalStructure,  ///< No work/rest alternation detected
    NoBaseline,           ///< No history baseline supplied
    ThinBaseline,         ///< Baseline has too few activities
    NoCheckIn,            ///< No check-in supplied
    NotApplicable,        ///< Metric does not apply to this activity
};

/// Stable snake_case identifier.
[[nodiscard]] const char* to_string(DataGap gap) noexcept;

// ─── Nullable ─────────────────────────────────────────────────────────────────

/// A value or the reason it is missing.
template <typename T>
class Nullable {
public:
    /// Construct a present value.
    static Nullable of(T value) {
        Nullable n;
        n.value_ = std::move(value);
        return n;
    }

    /// Construct an explicit null.
    static Nullable missing(DataGap reason) noexcept {
        Nullable n;
        n.gap_ = reason;
        return n;
    }

    [[nodiscard]] bool has_value() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    /// Precondition: has_value(). Throws std::bad_optional_access otherwise.
    [[nodiscard]] const T& value() const { return value_.value(); }
    [[nodiscard]] const T& operator*() const { return *value_; }
    [[nodiscard]] const T* operator->() const { return &*value_; }

    /// Reason for absence. Meaningful only when !has_value().
    [[nodiscard]] DataGap gap() const noexcept { return gap_; }

    /// Borrow as std::optional (drops the reason).
    [[nodiscard]] const std::optional<T>& as_optional() const noexcept { return value_; }

    bool operator==(const Nullable&) const = default;

private:
    Nullable() = default;

    std::optional<T> value_;
    DataGap          gap_{DataGap::NotApplicable};
};

}  // namespace tsig
