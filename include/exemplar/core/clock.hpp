//! # Clock
//!
//! Injected time source for example timing. The engine never reads the
//! system time directly; every timestamp comes through a `Clock`.

#ifndef EXEMPLAR_CORE_CLOCK_HPP
#define EXEMPLAR_CORE_CLOCK_HPP

#include "exemplar/common.hpp"

#include <chrono>

namespace exemplar::core {

using Timestamp = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

/// Time source capability.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> Timestamp = 0;
};

/// Monotonic clock backed by `std::chrono::steady_clock`.
class SystemClock : public Clock {
public:
    [[nodiscard]] auto now() const -> Timestamp override {
        return std::chrono::steady_clock::now();
    }

    /// Process-wide instance used when nothing else is injected.
    [[nodiscard]] static auto shared() -> Rc<Clock>;
};

/// Converts a duration to fractional seconds.
[[nodiscard]] inline auto to_seconds(Duration duration) -> double {
    return std::chrono::duration<double>(duration).count();
}

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_CLOCK_HPP
