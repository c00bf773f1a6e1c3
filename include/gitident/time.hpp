#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace gitident::timeutil {

// Point in time with millisecond resolution (Unix epoch).
using millis_time = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

inline auto to_millis(millis_time t) -> std::int64_t { return t.time_since_epoch().count(); }
inline auto from_millis(std::int64_t ms) -> millis_time {
  return millis_time{std::chrono::milliseconds{ms}};
}

// Source of "now".
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual auto now_millis() const -> std::int64_t = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now_millis() const -> std::int64_t override;
};

// A zone maps an instant to its UTC offset in minutes east of UTC.
// Offsets may vary with the instant (daylight saving).
class TimeZone {
public:
  virtual ~TimeZone() = default;
  [[nodiscard]] virtual auto id() const -> std::string = 0;
  [[nodiscard]] virtual auto offset_minutes_at(std::int64_t when_millis) const -> int = 0;
};

class FixedOffsetZone final : public TimeZone {
public:
  FixedOffsetZone(std::string id, int offset_minutes)
    : id_(std::move(id)), offset_(offset_minutes) {}

  [[nodiscard]] auto id() const -> std::string override { return id_; }
  [[nodiscard]] auto offset_minutes_at(std::int64_t /*when_millis*/) const -> int override {
    return offset_;
  }

private:
  std::string id_;
  int offset_;
};

// The process's local zone as configured by TZ / /etc/localtime.
class LocalTimeZone final : public TimeZone {
public:
  [[nodiscard]] auto id() const -> std::string override { return "localtime"; }
  [[nodiscard]] auto offset_minutes_at(std::int64_t when_millis) const -> int override;
};

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Shared instances for callers that want the real environment.
auto system_clock() -> const Clock &;
auto local_time_zone() -> const TimeZone &;

// Resolve "UTC", "GMT", "GMT+H", "GMT-HH", "GMT+HHMM", "GMT+HH:MM".
// Throws std::invalid_argument for anything else.
auto resolve_zone(std::string_view id) -> std::shared_ptr<const TimeZone>;

} // namespace gitident::timeutil
