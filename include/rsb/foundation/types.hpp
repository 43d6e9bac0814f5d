#pragma once

/// @file types.hpp
/// @brief Bridge-wide type aliases, strong ID types and time sources.

#include <chrono>
#include <cstdint>
#include <functional>

namespace rsb::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types at compile time while
/// keeping the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

// Tag types for strong IDs
struct RequestIdTag {};

/// Unique identifier assigned to every request entering the bridge.
using RequestId = StrongId<RequestIdTag>;

/// Invalid/null sentinel for any ID type.
template <typename Tag, typename T>
constexpr StrongId<Tag, T> NULL_ID{};

// ── Time ────────────────────────────────────────────────────────────────────

/// Wall clock used for admission refill, breaker cool-down and cache TTL.
using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

/// Injectable time source. Components default to WallClock::now; tests
/// substitute a manually advanced clock.
using TimeSource = std::function<TimePoint()>;

/// Default time source reading the system wall clock.
[[nodiscard]] inline TimeSource wallClock() {
    return [] { return WallClock::now(); };
}

/// Elapsed seconds between two wall-clock readings, clamped at zero so that
/// a clock stepped backwards never produces negative durations.
[[nodiscard]] inline double elapsedSeconds(TimePoint from, TimePoint to) noexcept {
    auto elapsed = std::chrono::duration<double>(to - from).count();
    return elapsed > 0.0 ? elapsed : 0.0;
}

} // namespace rsb::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<rsb::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const rsb::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
