#pragma once

#include <atomic>
#include <chrono>

#include "flowgate/core/types.hpp"

namespace flowgate {

/// Source of "current time" for token expiry checks.
/// Injected everywhere expiry is evaluated so boundaries are reproducible.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> Timestamp = 0;
};

/// Wall-clock seconds since the Unix epoch.
class SystemClock final : public Clock {
public:
    [[nodiscard]] auto now() const -> Timestamp override {
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
};

/// Clock that only moves when told to. Used by tests and scenario replay.
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    [[nodiscard]] auto now() const -> Timestamp override { return now_.load(); }

    void set(Timestamp t) { now_.store(t); }
    void advance(Timestamp seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace flowgate
