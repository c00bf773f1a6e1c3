#pragma once
#include "gitident/time.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace gitident {
class PersonIdent;
}

namespace gitident::format {

// Trim bytes <= 0x20 from both ends, then drop '\n', '<' and '>'.
// Same idea as C git's strbuf_addstr_without_crud.
void append_sanitized(std::string &out, std::string_view str);
auto sanitize(std::string_view str) -> std::string;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
void append_timezone(std::string &out, int minutes);
auto tz_offset_string(int minutes) -> std::string;

// "GMT" + ±HHMM, a fixed-offset zone id.
auto timezone_id(int minutes) -> std::string;
auto time_zone_for_offset(int minutes) -> std::shared_ptr<const timeutil::TimeZone>;

// Build "Name <email> 1714412345 +0300"
auto to_external_string(const PersonIdent &ident) -> std::string;

// "PersonIdent[Name, email, Tue Mar 21 02:34:09 2006 -0500]"
auto describe(const PersonIdent &ident) -> std::string;

} // namespace gitident::format
