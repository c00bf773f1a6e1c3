#include "gitident/ident_format.hpp"

#include "gitident/consts.hpp"
#include "gitident/person_ident.hpp"

#include <array>
#include <cstdio>
#include <ctime>

namespace {

// Anything up to and including ASCII space counts as padding. Compared
// unsigned so that UTF-8 multibyte sequences are never trimmed.
bool is_pad(char c) { return static_cast<unsigned char>(c) <= 0x20; }

} // namespace

namespace gitident::format {

void append_sanitized(std::string &out, std::string_view str) {
  while (!str.empty() && is_pad(str.front()))
    str.remove_prefix(1);
  while (!str.empty() && is_pad(str.back()))
    str.remove_suffix(1);

  for (const char c : str) {
    switch (c) {
    case '\n':
    case '<':
    case '>':
      continue;
    default:
      out.push_back(c);
      break;
    }
  }
}

std::string sanitize(std::string_view str) {
  std::string out;
  out.reserve(str.size());
  append_sanitized(out, str);
  return out;
}

void append_timezone(std::string &out, int minutes) {
  const char sign = minutes >= 0 ? '+' : '-';
  // 64-bit so that negating INT_MIN is defined
  long long m = minutes;
  if (m < 0)
    m = -m;
  const long long hh = m / consts::kMinutesPerHour;
  const long long mm = m % consts::kMinutesPerHour;

  std::array<char, 32> buf{};
  const int n = std::snprintf(buf.data(), buf.size(), "%c%02lld%02lld", sign, hh, mm);
  out.append(buf.data(), static_cast<std::size_t>(n));
}

std::string tz_offset_string(int minutes) {
  std::string s;
  append_timezone(s, minutes);
  return s;
}

std::string timezone_id(int minutes) {
  std::string id(consts::kZonePrefix);
  append_timezone(id, minutes);
  return id;
}

std::shared_ptr<const timeutil::TimeZone> time_zone_for_offset(int minutes) {
  return timeutil::resolve_zone(timezone_id(minutes));
}

std::string to_external_string(const PersonIdent &ident) {
  std::string r;
  append_sanitized(r, ident.name());
  r.append(consts::kEmailOpen);
  append_sanitized(r, ident.email());
  r.append(consts::kEmailClose);
  r.append(std::to_string(ident.when_millis() / consts::kMillisPerSecond));
  r.push_back(consts::kSpace);
  append_timezone(r, ident.tz_offset());
  return r;
}

std::string describe(const PersonIdent &ident) {
  // Shift by the ident's own offset and render as UTC, so the result does
  // not depend on the process time zone or locale.
  // Floor, not truncate: -1500 ms is 23:59:58 on the previous day.
  long long secs = ident.when_millis() / consts::kMillisPerSecond;
  if (ident.when_millis() % consts::kMillisPerSecond < 0)
    --secs;
  const long long local_secs =
      secs + (static_cast<long long>(ident.tz_offset()) * consts::kSecondsPerMinute);
  const auto t = static_cast<std::time_t>(local_secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::array<char, 64> date{};
  std::array<char, 16> wday_mon{};
  std::array<char, 32> clock_year{};
  std::strftime(wday_mon.data(), wday_mon.size(), "%a %b", &tm);
  std::strftime(clock_year.data(), clock_year.size(), "%H:%M:%S %Y", &tm);
  std::snprintf(date.data(), date.size(), "%s %d %s ", wday_mon.data(), tm.tm_mday,
                clock_year.data());

  std::string r = "PersonIdent[";
  r += ident.name();
  r += ", ";
  r += ident.email();
  r += ", ";
  r += date.data();
  append_timezone(r, ident.tz_offset());
  r += "]";
  return r;
}

} // namespace gitident::format
