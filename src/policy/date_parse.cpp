#include "fwf/date_parse.hpp"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <string_view>

// NOTE: timezone offsets are accepted but treated as Z (UTC).

namespace fwf {

static bool is_digit(char c){ return c>='0' && c<='9'; }
static bool is_alpha(char c){ return (c>='A' && c<='Z') || (c>='a' && c<='z'); }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

bool is_leap_year(int y) noexcept {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int days_in_month(int y, int m) noexcept {
  static constexpr int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m < 1 || m > 12) return 0;
  return (m == 2 && is_leap_year(y)) ? 29 : days[m-1];
}

// timegm normalizes out-of-range fields, so validate first.
static std::optional<std::int64_t> to_epoch_ms(int Y, int M, int D, int h, int m, int sec, int ms) {
  if (Y < 1 || M < 1 || M > 12 || D < 1 || D > days_in_month(Y, M)) return std::nullopt;
  if (h < 0 || h > 23 || m < 0 || m > 59 || sec < 0 || sec > 60) return std::nullopt;

  std::tm tm{}; tm.tm_year = Y - 1900; tm.tm_mon = M - 1; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = sec;
#if defined(_WIN32)
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == (std::time_t)-1 && !(Y == 1969 && M == 12 && D == 31)) return std::nullopt;

  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return static_cast<std::int64_t>(ms_epoch + ms);
}

// Parses [T| ]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM] starting at i. Returns false
// on malformed input; leaves has_time false when nothing follows the date.
static bool parse_time_tail(std::string_view s, size_t i,
                            int& h, int& m, int& sec, int& ms, bool& has_time) {
  has_time = false;
  if (i == s.size()) return true;
  if (s[i] != 'T' && s[i] != 't' && s[i] != ' ' && s[i] != ':') return false;
  ++i;
  if (i + 5 > s.size()) return false;
  if (!(parse_int(s.substr(i,2), h) && s[i+2]==':' && parse_int(s.substr(i+3,2), m)))
    return false;
  i += 5;
  if (i < s.size() && s[i] == ':') {
    if (i + 3 > s.size() || !parse_int(s.substr(i+1,2), sec)) return false;
    i += 3;
    if (i < s.size() && s[i]=='.') {
      size_t j=i+1, k=j;
      while (k < s.size() && is_digit(s[k])) ++k;
      if (k == j) return false;
      int frac=0; (void)parse_int(s.substr(j, std::min<size_t>(k-j, 3)), frac);
      if ((k-j)==1) ms = frac*100;
      else if ((k-j)==2) ms = frac*10;
      else ms = frac;
      i = k;
    }
  }
  if (i < s.size() && (s[i]=='Z' || s[i]=='z')) ++i;
  else if (i < s.size() && (s[i]=='+' || s[i]=='-')) {
    int oh = 0, om = 0;
    std::string_view off = s.substr(i+1);
    if (off.size() == 5 && off[2] == ':') {
      if (!(parse_int(off.substr(0,2), oh) && parse_int(off.substr(3,2), om))) return false;
    } else if (off.size() == 4 || off.size() == 2) {
      if (!parse_int(off, oh)) return false;
    } else {
      return false;
    }
    i = s.size();
  }
  if (i != s.size()) return false;
  has_time = true;
  return true;
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  // Expected forms:
  // YYYY-MM-DD
  // YYYY-MM-DDTHH:MM[:SS[.mmm]]
  // All optionally suffixed with 'Z' or an offset (ignored as Z here)
  if (s.size() < 10) return std::nullopt;
  int Y,M,D,h=0,m=0,sec=0,ms=0;

  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return std::nullopt;

  bool has_time = false;
  if (!parse_time_tail(s, 10, h, m, sec, ms, has_time)) return std::nullopt;
  return to_epoch_ms(Y, M, D, h, m, sec, ms);
}

static int month_from_name(std::string_view name) {
  static constexpr std::string_view months[] = {
    "january","february","march","april","may","june",
    "july","august","september","october","november","december"};
  if (name.size() < 3) return 0;
  std::string lower;
  for (char c : name) lower.push_back(static_cast<char>(std::tolower((unsigned char)c)));
  for (int i = 0; i < 12; ++i) {
    if (lower.size() == 3 && months[i].substr(0,3) == lower) return i + 1;
    if (lower == months[i]) return i + 1;
  }
  // "Sept"
  if (lower == "sept") return 9;
  return 0;
}

static std::optional<Date> finish(int Y, int M, int D, std::string_view s, size_t tail) {
  int h=0, m=0, sec=0, ms=0; bool has_time=false;
  if (!parse_time_tail(s, tail, h, m, sec, ms, has_time)) return std::nullopt;
  auto t = to_epoch_ms(Y, M, D, h, m, sec, ms);
  if (!t) return std::nullopt;
  return Date{*t, has_time};
}

std::optional<Date> parse_date(std::string_view s) {
  if (s.empty()) return std::nullopt;
  int Y=0, M=0, D=0;

  // YYYY-MM-DD / YYYY/MM/DD (+ optional time)
  if (s.size() >= 10 && is_digit(s[0]) && (s[4]=='-' || s[4]=='/') && s[7]==s[4]) {
    if (!(parse_int(s.substr(0,4), Y) && parse_int(s.substr(5,2), M) && parse_int(s.substr(8,2), D)))
      return std::nullopt;
    return finish(Y, M, D, s, 10);
  }

  // YYYYMMDD
  if (s.size() == 8 && parse_int(s, Y)) {
    (void)parse_int(s.substr(0,4), Y); (void)parse_int(s.substr(4,2), M); (void)parse_int(s.substr(6,2), D);
    return finish(Y, M, D, s, 8);
  }

  size_t i = 0;
  if (is_digit(s[0])) {
    while (i < s.size() && is_digit(s[i])) ++i;
    if (i > 2 || i == s.size()) return std::nullopt;
    int first = 0; (void)parse_int(s.substr(0, i), first);

    // M/D/YYYY
    if (s[i] == '/') {
      size_t j = i + 1, k = j;
      while (k < s.size() && is_digit(s[k])) ++k;
      if (k == j || k - j > 2 || k >= s.size() || s[k] != '/') return std::nullopt;
      if (!parse_int(s.substr(j, k-j), D)) return std::nullopt;
      size_t y0 = k + 1, y1 = y0;
      while (y1 < s.size() && is_digit(s[y1])) ++y1;
      if (y1 - y0 != 4 || !parse_int(s.substr(y0, 4), Y)) return std::nullopt;
      M = first;
      return finish(Y, M, D, s, y1);
    }

    // DDMONYYYY / DD-MON-YYYY
    D = first;
    if (s[i] == '-' || s[i] == ' ') ++i;
    size_t a = i;
    while (i < s.size() && is_alpha(s[i])) ++i;
    M = month_from_name(s.substr(a, i - a));
    if (M == 0) return std::nullopt;
    if (i < s.size() && (s[i] == '-' || s[i] == ' ')) ++i;
    size_t y0 = i;
    while (i < s.size() && is_digit(s[i])) ++i;
    if (i - y0 != 4 || !parse_int(s.substr(y0, 4), Y)) return std::nullopt;
    return finish(Y, M, D, s, i);
  }

  // Mon DD, YYYY / Mon DD YYYY
  if (is_alpha(s[0])) {
    while (i < s.size() && is_alpha(s[i])) ++i;
    M = month_from_name(s.substr(0, i));
    if (M == 0) return std::nullopt;
    if (i < s.size() && (s[i] == ' ' || s[i] == '-')) ++i;
    size_t d0 = i;
    while (i < s.size() && is_digit(s[i])) ++i;
    if (i == d0 || i - d0 > 2 || !parse_int(s.substr(d0, i - d0), D)) return std::nullopt;
    if (i < s.size() && s[i] == ',') ++i;
    if (i < s.size() && (s[i] == ' ' || s[i] == '-')) ++i;
    size_t y0 = i;
    while (i < s.size() && is_digit(s[i])) ++i;
    if (i - y0 != 4 || !parse_int(s.substr(y0, 4), Y)) return std::nullopt;
    return finish(Y, M, D, s, i);
  }

  return std::nullopt;
}

std::string to_string(const Date& d) {
  std::int64_t secs = d.epoch_ms / 1000;
  int ms = static_cast<int>(d.epoch_ms % 1000);
  if (ms < 0) { ms += 1000; --secs; }
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[40];
  if (!d.has_time) {
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  } else if (ms == 0) {
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  } else {
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  }
  return buf;
}

}
