#pragma once
#include "witnesschain/core/clock.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace witnesschain::vault::test_helpers {

/// Manually advanced clock. Copies share the same time source.
class FakeClock {
public:
    explicit FakeClock(const int64_t start_unix_seconds = 1700000000)
        : now_ms_(std::make_shared<std::atomic<int64_t>>(start_unix_seconds * 1000)) {}

    [[nodiscard]] Clock AsClock() const {
        auto now_ms = now_ms_;
        return [now_ms] { return FromUnixMillis(now_ms->load()); };
    }

    [[nodiscard]] TimePoint Now() const { return FromUnixMillis(now_ms_->load()); }

    [[nodiscard]] int64_t NowSeconds() const { return ToUnixSeconds(Now()); }

    template<typename Rep, typename Period>
    void Advance(const std::chrono::duration<Rep, Period> delta) {
        now_ms_->fetch_add(std::chrono::duration_cast<std::chrono::milliseconds>(delta).count());
    }

private:
    std::shared_ptr<std::atomic<int64_t>> now_ms_;
};

}
