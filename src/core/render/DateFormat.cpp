#include "DateFormat.hpp"

#include <cctype>
#include <cstdio>

namespace certgen {

namespace {

bool digits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}

bool is_leap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && is_leap(y) ? 29 : kDays[m - 1];
}

// Days since 1970-01-01 and back (proleptic Gregorian).
long days_from_civil(int y, int m, int d) {
  y -= m <= 2;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = y - era * 400;
  const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(long z) {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const long doe = z - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp = (5 * doy + 2) / 153;
  CivilDate out;
  out.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  out.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  out.year = static_cast<int>(era * 400 + yoe + (out.month <= 2));
  return out;
}

// 1 = Monday .. 7 = Sunday
int iso_weekday(long days) {
  return static_cast<int>(((days % 7) + 10) % 7) + 1;
}

// Week 53 exists only when 1 January is a Thursday, or a Wednesday in a leap year.
std::optional<CivilDate> from_iso_week(int year, int week, int weekday) {
  if (week < 1 || week > 53 || weekday < 1 || weekday > 7) return std::nullopt;
  if (week == 53) {
    const int jan1 = iso_weekday(days_from_civil(year, 1, 1));
    if (!(jan1 == 4 || (jan1 == 3 && is_leap(year)))) return std::nullopt;
  }
  const long jan4 = days_from_civil(year, 1, 4);
  const long week1Monday = jan4 - (iso_weekday(jan4) - 1);
  const CivilDate d = civil_from_days(week1Monday + (week - 1) * 7L + (weekday - 1));
  if (d.year < 1 || d.year > 9999) return std::nullopt;
  return d;
}

// YYYY-Www[-D] or YYYYWww[D]; `pos` ends past the date part.
std::optional<CivilDate> parse_week_date(const std::string& text, int year, std::size_t& pos) {
  const bool extended = text[4] == '-';
  pos = extended ? 6 : 5;
  int week = 0;
  if (!digits(text, pos, 2, week)) return std::nullopt;
  pos += 2;
  int weekday = 1;
  if (pos < text.size()) {
    if (extended && text[pos] == '-') {
      if (!digits(text, pos + 1, 1, weekday)) return std::nullopt;
      pos += 2;
    } else if (std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (extended) return std::nullopt;
      weekday = text[pos] - '0';
      ++pos;
    }
  }
  return from_iso_week(year, week, weekday);
}

// HH[:MM[:SS[.f+]]] or HH[MM[SS[.f+]]], consuming the whole of `t`.
bool valid_clock(const std::string& t, std::size_t& pos) {
  int hh = 0, mm = 0, ss = 0;
  if (!digits(t, pos, 2, hh) || hh > 23) return false;
  pos += 2;
  if (pos == t.size()) return true;

  const bool extended = t[pos] == ':';
  auto next = [&](int& v, int max) {
    if (extended) {
      if (pos >= t.size() || t[pos] != ':') return false;
      ++pos;
    }
    if (!digits(t, pos, 2, v) || v > max) return false;
    pos += 2;
    return true;
  };

  if (!std::isdigit(static_cast<unsigned char>(t[pos])) && !extended) return true;
  if (!next(mm, 59)) return false;
  if (pos == t.size() || (t[pos] != ':' && !std::isdigit(static_cast<unsigned char>(t[pos])))) {
    return true;
  }
  if (!next(ss, 59)) return false;
  if (pos < t.size() && (t[pos] == '.' || t[pos] == ',')) {
    ++pos;
    const std::size_t start = pos;
    while (pos < t.size() && std::isdigit(static_cast<unsigned char>(t[pos]))) ++pos;
    if (pos == start) return false;
  }
  return true;
}

// Z | +HH | +HH:MM | +HHMM | +HH:MM:SS
bool valid_offset(const std::string& t, std::size_t pos) {
  if (pos == t.size()) return true;
  if (t[pos] == 'Z') return pos + 1 == t.size();
  if (t[pos] != '+' && t[pos] != '-') return false;
  ++pos;
  std::size_t p = pos;
  if (!valid_clock(t, p)) return false;
  return p == t.size();
}

} // namespace

std::optional<CivilDate> parse_iso_date(const std::string& text) {
  CivilDate d;
  std::size_t pos = 0;
  if (!digits(text, 0, 4, d.year)) return std::nullopt;
  if (text.size() > 5 && (text[4] == 'W' || (text[4] == '-' && text[5] == 'W'))) {
    auto week = parse_week_date(text, d.year, pos);
    if (!week) return std::nullopt;
    d = *week;
  } else if (text.size() >= 10 && text[4] == '-') {
    if (text[7] != '-' || !digits(text, 5, 2, d.month) || !digits(text, 8, 2, d.day)) {
      return std::nullopt;
    }
    pos = 10;
  } else {
    if (!digits(text, 4, 2, d.month) || !digits(text, 6, 2, d.day)) return std::nullopt;
    pos = 8;
  }
  if (d.year < 1 || d.month < 1 || d.month > 12) return std::nullopt;
  if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;

  if (pos == text.size()) return d;

  // any single separator character, then a time
  ++pos;
  if (pos >= text.size()) return std::nullopt;
  if (!valid_clock(text, pos)) return std::nullopt;
  if (!valid_offset(text, pos)) return std::nullopt;
  return d;
}

std::string format_mmddyyyy(const std::string& text) {
  const auto d = parse_iso_date(text);
  if (!d) return text;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", d->month, d->day, d->year);
  return buf;
}

} // namespace certgen
