#include "gitident/person_ident.hpp"

#include "gitident/config.hpp"
#include "gitident/consts.hpp"
#include "gitident/ident_format.hpp"

#include <stdexcept>
#include <utility>

namespace {

std::string require(std::optional<std::string> value, const char *what) {
  if (!value) {
    throw std::invalid_argument(std::string(what) + " must not be null");
  }
  return std::move(*value);
}

} // namespace

namespace gitident {

PersonIdent::PersonIdent(std::optional<std::string> name, std::optional<std::string> email,
                         std::int64_t when_millis, int tz_offset_minutes)
    : name_(require(std::move(name), "person ident name")),
      email_(require(std::move(email), "person ident email")), when_(when_millis),
      tz_offset_(tz_offset_minutes) {}

PersonIdent::PersonIdent(std::optional<std::string> name, std::optional<std::string> email,
                         const timeutil::Clock &clock, const timeutil::TimeZone &local_zone)
    : PersonIdent(std::move(name), std::move(email), timeutil::from_millis(clock.now_millis()),
                  local_zone) {}

PersonIdent::PersonIdent(std::optional<std::string> name, std::optional<std::string> email,
                         timeutil::millis_time when, const timeutil::TimeZone &zone)
    : PersonIdent(std::move(name), std::move(email), timeutil::to_millis(when),
                  zone.offset_minutes_at(timeutil::to_millis(when))) {}

auto PersonIdent::from_config(const ConfigSource &config, const timeutil::Clock &clock,
                              const timeutil::TimeZone &local_zone) -> PersonIdent {
  return PersonIdent{config.committer_name(), config.committer_email(), clock, local_zone};
}

auto PersonIdent::with_offset_and_time(std::int64_t when_millis, int tz_offset_minutes) const
    -> PersonIdent {
  return PersonIdent{name_, email_, when_millis, tz_offset_minutes};
}

auto PersonIdent::with_time_keep_offset(timeutil::millis_time when) const -> PersonIdent {
  return PersonIdent{name_, email_, timeutil::to_millis(when), tz_offset_};
}

auto PersonIdent::with_zone_at_instant(timeutil::millis_time when,
                                       const timeutil::TimeZone &zone) const -> PersonIdent {
  return PersonIdent{name_, email_, when, zone};
}

auto PersonIdent::with_current_time(const timeutil::Clock &clock,
                                    const timeutil::TimeZone &local_zone) const -> PersonIdent {
  return PersonIdent{name_, email_, clock, local_zone};
}

auto PersonIdent::time_zone() const -> std::shared_ptr<const timeutil::TimeZone> {
  return format::time_zone_for_offset(tz_offset_);
}

auto PersonIdent::to_external_string() const -> std::string {
  return format::to_external_string(*this);
}

auto PersonIdent::to_string() const -> std::string { return format::describe(*this); }

// Name is left out; equal idents still hash equal.
auto PersonIdent::hash() const -> std::size_t {
  std::size_t hc = std::hash<std::string>{}(email_);
  hc *= 31;
  hc += static_cast<std::size_t>(when_ / consts::kMillisPerSecond);
  return hc;
}

bool operator==(const PersonIdent &a, const PersonIdent &b) {
  return a.name_ == b.name_ && a.email_ == b.email_ &&
         a.when_ / consts::kMillisPerSecond == b.when_ / consts::kMillisPerSecond;
}

} // namespace gitident
