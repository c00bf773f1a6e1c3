#include "cli/stamp.hpp"

#include "gitident/time.hpp"

#include <charconv>
#include <memory>
#include <stdexcept>

namespace gitident::cli {

std::int64_t parse_millis(std::string_view text) {
  std::int64_t v = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    throw std::invalid_argument("bad date (want milliseconds since the epoch): " +
                                std::string(text));
  }
  return v;
}

PersonIdent stamp_ident(const UserConfig &cfg, const StampOptions &opts) {
  namespace tu = gitident::timeutil;

  std::shared_ptr<const tu::TimeZone> custom_zone;
  if (opts.zone)
    custom_zone = tu::resolve_zone(*opts.zone);
  const tu::TimeZone &zone = custom_zone ? *custom_zone : tu::local_time_zone();

  if (opts.date) {
    return PersonIdent{cfg.committer_name(), cfg.committer_email(),
                       tu::from_millis(parse_millis(*opts.date)), zone};
  }
  return PersonIdent::from_config(cfg, tu::system_clock(), zone);
}

} // namespace gitident::cli
