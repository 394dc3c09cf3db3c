#pragma once
#include <optional>
#include <string>

namespace certgen {

struct CivilDate {
  int year  = 0;
  int month = 0;
  int day   = 0;
};

// ISO-8601 date or date-time ("2024-01-15", "20240115", "2024-W10-2",
// "2024-01-15T10:30:00.123+02:00", ...). Only the calendar date is kept.
std::optional<CivilDate> parse_iso_date(const std::string& text);

// "2024-03-05" -> "03/05/2024". Anything unparseable is returned unchanged.
std::string format_mmddyyyy(const std::string& text);

} // namespace certgen
