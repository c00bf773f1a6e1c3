#pragma once
#include "gitident/time.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gitident {

class ConfigSource;

/**
 * Name + email + time + time zone: who wrote or committed something.
 *
 * Name and email are kept exactly as given (whitespace and all) for the
 * lifetime of the value; they are only sanitized when the external line
 * is produced, so the line is not a lossless encoding of the value.
 *
 * Equality and hashing look at name, email and the timestamp truncated
 * to whole seconds. The time zone offset takes no part in either.
 */
class PersonIdent {
public:
  // Throws std::invalid_argument if name or email is std::nullopt.
  PersonIdent(std::optional<std::string> name, std::optional<std::string> email,
              std::int64_t when_millis, int tz_offset_minutes);

  // Stamped "now": time from `clock`, offset from `local_zone` at that instant.
  PersonIdent(std::optional<std::string> name, std::optional<std::string> email,
              const timeutil::Clock &clock, const timeutil::TimeZone &local_zone);

  // Offset is whatever `zone` says at `when`.
  PersonIdent(std::optional<std::string> name, std::optional<std::string> email,
              timeutil::millis_time when, const timeutil::TimeZone &zone);

  // Committer name/email from configuration, stamped "now".
  static auto from_config(const ConfigSource &config, const timeutil::Clock &clock,
                          const timeutil::TimeZone &local_zone) -> PersonIdent;

  [[nodiscard]] auto with_offset_and_time(std::int64_t when_millis, int tz_offset_minutes) const
      -> PersonIdent;
  [[nodiscard]] auto with_time_keep_offset(timeutil::millis_time when) const -> PersonIdent;
  [[nodiscard]] auto with_zone_at_instant(timeutil::millis_time when,
                                          const timeutil::TimeZone &zone) const -> PersonIdent;
  [[nodiscard]] auto with_current_time(const timeutil::Clock &clock,
                                       const timeutil::TimeZone &local_zone) const -> PersonIdent;

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::string &email() const { return email_; }
  [[nodiscard]] auto when() const -> timeutil::millis_time { return timeutil::from_millis(when_); }
  [[nodiscard]] auto when_millis() const -> std::int64_t { return when_; }
  // Minutes east of UTC; negative west of UTC.
  [[nodiscard]] auto tz_offset() const -> int { return tz_offset_; }
  [[nodiscard]] auto time_zone() const -> std::shared_ptr<const timeutil::TimeZone>;

  // "Name <email> 1142878449 -0500"
  [[nodiscard]] auto to_external_string() const -> std::string;
  // Debug rendering; not for storage.
  [[nodiscard]] auto to_string() const -> std::string;

  [[nodiscard]] auto hash() const -> std::size_t;

  friend bool operator==(const PersonIdent &a, const PersonIdent &b);

private:
  std::string name_;
  std::string email_;
  std::int64_t when_;
  int tz_offset_;
};

} // namespace gitident

template <> struct std::hash<gitident::PersonIdent> {
  auto operator()(const gitident::PersonIdent &p) const noexcept -> std::size_t {
    return p.hash();
  }
};
