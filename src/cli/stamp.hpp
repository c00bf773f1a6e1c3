#pragma once
#include "gitident/config.hpp"
#include "gitident/person_ident.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gitident::cli {

// --date / --zone overrides shared by the stamping commands.
struct StampOptions {
  std::optional<std::string> date; // milliseconds since the epoch
  std::optional<std::string> zone; // resolve_zone id
};

// Whole argument must be a (signed) decimal integer; throws std::invalid_argument.
auto parse_millis(std::string_view text) -> std::int64_t;

// Committer from `cfg`, stamped now in the local zone unless overridden.
auto stamp_ident(const UserConfig &cfg, const StampOptions &opts) -> PersonIdent;

} // namespace gitident::cli
