#include "gitident/ident_format.hpp"
#include "gitident/person_ident.hpp"
#include "gitident/time.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tu = gitident::timeutil;

static bool resolves_to(const std::string &id, int want) {
  const auto zone = tu::resolve_zone(id);
  if (zone->offset_minutes_at(0) != want) {
    std::cerr << id << ": got " << zone->offset_minutes_at(0) << " want " << want << "\n";
    return false;
  }
  return true;
}

static bool rejects(const std::string &id) {
  try {
    (void)tu::resolve_zone(id);
  } catch (const std::invalid_argument &) {
    return true;
  }
  std::cerr << id << ": accepted\n";
  return false;
}

int main() {
  try {
    if (!resolves_to("UTC", 0) || !resolves_to("GMT", 0) || !resolves_to("GMT+0530", 330) ||
        !resolves_to("GMT-0130", -90) || !resolves_to("GMT+5", 300) ||
        !resolves_to("GMT-11", -660) || !resolves_to("GMT+05:45", 345) ||
        !resolves_to("GMT+10000", 6000))
      return 1;
    if (!rejects("") || !rejects("Mars/Olympus") || !rejects("GMT+") || !rejects("GMT0530") ||
        !rejects("GMT+0575") || !rejects("GMT+05:4") || !rejects("GMT+ab") ||
        !rejects("GMT+12345678901") || !rejects("GMT+-5"))
      return 1;

    // every id we format resolves back to its offset
    for (int m : {0, 1, -1, 59, -59, 60, 330, -300, 660, 840, -720, 1439, 6000}) {
      const auto zone = gitident::format::time_zone_for_offset(m);
      if (zone->offset_minutes_at(0) != m || zone->id() != gitident::format::timezone_id(m)) {
        std::cerr << "round trip failed for " << m << "\n";
        return 1;
      }
    }

    // local zone follows TZ, including daylight saving at the given instant
    ::setenv("TZ", "EST5EDT,M3.2.0,M11.1.0", 1);
    ::tzset();
    const tu::LocalTimeZone local{};
    const std::int64_t january = 1136073600000LL; // 2006-01-01T00:00:00Z
    const std::int64_t july = 1151712000000LL;    // 2006-07-01T00:00:00Z
    if (local.offset_minutes_at(january) != -300 || local.offset_minutes_at(july) != -240) {
      std::cerr << "local offsets: " << local.offset_minutes_at(january) << " "
                << local.offset_minutes_at(july) << "\n";
      return 1;
    }
    const gitident::PersonIdent base{"A", "a@example.com", 0, 0};
    if (base.with_zone_at_instant(tu::from_millis(july), local).to_external_string() !=
        "A <a@example.com> 1151712000 -0400") {
      std::cerr << "summer stamp wrong\n";
      return 1;
    }

    ::setenv("TZ", "UTC0", 1);
    ::tzset();
    if (tu::local_time_zone().offset_minutes_at(july) != 0) {
      std::cerr << "UTC0 offset not zero\n";
      return 1;
    }

    // the system clock is in the right era
    if (tu::system_clock().now_millis() < 1142878449000LL) {
      std::cerr << "system clock before 2006\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
