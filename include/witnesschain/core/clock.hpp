#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
namespace witnesschain::vault {
using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;
inline Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}
inline int64_t ToUnixSeconds(const TimePoint point) {
    return std::chrono::duration_cast<std::chrono::seconds>(point.time_since_epoch()).count();
}
inline int64_t ToUnixMillis(const TimePoint point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}
inline TimePoint FromUnixMillis(const int64_t millis) {
    return TimePoint(std::chrono::milliseconds(millis));
}
}
