#pragma once

#include <compare>
#include <cstdint>

namespace tracksim::core {

/// @brief Time interval represented as an integer nanosecond count.
///
/// Duration wraps an `int64_t` nanosecond value with a private constructor.
/// All construction goes through named factories or bridge functions, so
/// conversions between seconds (double) and nanoseconds (int64_t) are always
/// explicit. Integer storage keeps event ordering exact: two waiting times
/// that add up to the same instant compare equal on every platform.
///
/// @see duration_from_seconds, duration_from_nanoseconds, duration_to_seconds
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_;

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    // Round double seconds to nearest nanosecond
    static constexpr int64_t secs_to_ns(double s) noexcept {
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ns_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Convert to seconds (double).
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }

    /// @brief Return the raw nanosecond count.
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept {
        return ns_;
    }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ns_ + rhs.ns_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ns_ - rhs.ns_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    /// @brief Multiply by an integer count (e.g. tick length times tick index).
    constexpr Duration operator*(int64_t count) const noexcept {
        return Duration{ns_ * count};
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute simulation time as a Duration offset from epoch (time zero).
///
/// TimePoint + Duration yields TimePoint; TimePoint - TimePoint yields
/// Duration. Two TimePoints cannot be added.
///
/// @see time_from_seconds, time_to_seconds, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;
    friend constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept;

public:
    /// @brief Default constructor: epoch (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the epoch (time zero).
    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since epoch.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

/// @brief Index of a site on the track.
///
/// Signed so that a rule can express a target one step beyond either end;
/// the engine decides what such a move means from the boundary mode.
/// @ingroup core_types
using Site = int64_t;

/// @brief Stable identity of a particle.
///
/// Assigned by the engine in creation order and never reused within a run.
/// Ordering is significant: synchronous tie-breaks favour the lower id.
/// @ingroup core_types
struct ParticleId {
    uint64_t value{0}; ///< Raw identifier.

    constexpr bool operator==(const ParticleId&) const = default;
    constexpr auto operator<=>(const ParticleId&) const = default;
};

// ============================================================================
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from a value in seconds (round to nearest ns).
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

/// @brief Convert a Duration to seconds (double).
[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Create a Duration from a raw nanosecond count.
[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

/// @brief Extract the raw nanosecond count from a Duration.
[[nodiscard]] constexpr int64_t duration_to_nanoseconds(Duration d) noexcept {
    return d.nanoseconds();
}

/// @brief Create a TimePoint from a value in seconds since epoch.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

/// @brief Create a TimePoint from a raw nanosecond count since epoch.
///
/// Used when restoring checkpoints so that times round-trip exactly.
[[nodiscard]] constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept {
    return TimePoint{duration_from_nanoseconds(ns)};
}

/// @brief Convert a TimePoint to seconds since epoch (double).
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

/// @brief Extract the raw nanosecond count since epoch from a TimePoint.
[[nodiscard]] constexpr int64_t time_to_nanoseconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().nanoseconds();
}

} // namespace tracksim::core
