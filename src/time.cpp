#include "gitident/time.hpp"

#include "gitident/consts.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <stdexcept>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static std::time_t timegm_portable(std::tm *t) { return _mkgmtime(t); }
#else
// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }
#endif

namespace {

[[noreturn]] void bad_zone(std::string_view id) {
  throw std::invalid_argument("unknown time zone id: " + std::string(id));
}

auto parse_digits(std::string_view digits, std::string_view id) -> long long {
  if (digits.empty() || digits.size() > 9 ||
      !std::ranges::all_of(digits, [](char c) { return c >= '0' && c <= '9'; })) {
    bad_zone(id);
  }
  long long v = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    bad_zone(id);
  }
  return v;
}

} // namespace

namespace gitident::timeutil {

auto SystemClock::now_millis() const -> std::int64_t {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  return to_millis(now);
}

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
#if defined(_WIN32)
  localtime_s(&lt, &t);
  gmtime_s(&gt, &t);
#else
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
#endif
  // Read the local wall clock back as if it were UTC; the difference is the offset.
  const std::time_t local_as_utc = timegm_portable(&lt);
  const std::time_t utc_epoch = timegm_portable(&gt);
  const long long diff = static_cast<long long>(local_as_utc) - utc_epoch; // seconds
  return static_cast<int>(diff / consts::kSecondsPerMinute);
}

auto LocalTimeZone::offset_minutes_at(std::int64_t when_millis) const -> int {
  return local_utc_offset_minutes(static_cast<std::time_t>(when_millis / consts::kMillisPerSecond));
}

auto system_clock() -> const Clock & {
  static const SystemClock clock{};
  return clock;
}

auto local_time_zone() -> const TimeZone & {
  static const LocalTimeZone zone{};
  return zone;
}

auto resolve_zone(std::string_view id) -> std::shared_ptr<const TimeZone> {
  if (id == "UTC" || id == consts::kZonePrefix) {
    return std::make_shared<FixedOffsetZone>(std::string(id), 0);
  }
  if (id.rfind(consts::kZonePrefix, 0) != 0 || id.size() < consts::kZonePrefix.size() + 2) {
    bad_zone(id);
  }
  std::string_view rest = id.substr(consts::kZonePrefix.size());
  const char sign = rest.front();
  if (sign != '+' && sign != '-') {
    bad_zone(id);
  }
  rest.remove_prefix(1);

  long long hours = 0;
  long long minutes = 0;
  if (const auto colon = rest.find(':'); colon != std::string_view::npos) {
    const std::string_view mm = rest.substr(colon + 1);
    if (mm.size() != 2) {
      bad_zone(id);
    }
    hours = parse_digits(rest.substr(0, colon), id);
    minutes = parse_digits(mm, id);
  } else if (rest.size() <= 2) {
    hours = parse_digits(rest, id);
  } else {
    hours = parse_digits(rest.substr(0, rest.size() - 2), id);
    minutes = parse_digits(rest.substr(rest.size() - 2), id);
  }
  if (minutes >= consts::kMinutesPerHour) {
    bad_zone(id);
  }

  long long total = (hours * consts::kMinutesPerHour) + minutes;
  if (sign == '-') {
    total = -total;
  }
  if (total > std::numeric_limits<int>::max() || total < std::numeric_limits<int>::min()) {
    bad_zone(id);
  }
  return std::make_shared<FixedOffsetZone>(std::string(id), static_cast<int>(total));
}

} // namespace gitident::timeutil
