#include "gitstore/time.hpp"

#include "gitstore/errors.hpp"

#include <charconv>
#include <cstdio>
#include <stdexcept>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static std::time_t timegm_portable(std::tm *t) { return _mkgmtime(t); }
#else
// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }
#endif

namespace gitstore::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
#if defined(_WIN32)
  localtime_s(&lt, &t);
  gmtime_s(&gt, &t);
#else
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
#endif
  // Both broken-down times read back as if they were UTC; the gap is the offset.
  const std::time_t local_epoch = timegm_portable(&lt);
  const std::time_t utc_epoch = timegm_portable(&gt);
  const long diff = static_cast<long>(local_epoch - utc_epoch); // seconds
  return static_cast<int>(diff / 60);                           // minutes
}

std::string tz_offset_string(int minutes, bool negative_zero) {
  char buf[16];
  char sign = minutes > 0 || (minutes == 0 && !negative_zero) ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, hh, mm);
  return std::string(buf);
}

int parse_tz_offset(std::string_view text, std::string_view field) {
  if (text.size() != 5 || (text[0] != '+' && text[0] != '-')) {
    throw DecodeError(field, "bad timezone '" + std::string(text) + "'");
  }
  int hh = 0;
  int mm = 0;
  const auto r1 = std::from_chars(text.data() + 1, text.data() + 3, hh);
  const auto r2 = std::from_chars(text.data() + 3, text.data() + 5, mm);
  if (r1.ec != std::errc{} || r1.ptr != text.data() + 3 || r2.ec != std::errc{} ||
      r2.ptr != text.data() + 5 || mm >= 60) {
    throw DecodeError(field, "bad timezone '" + std::string(text) + "'");
  }
  const int minutes = (hh * 60) + mm;
  return text[0] == '-' ? -minutes : minutes;
}

Signature make_signature(const Identity &id, std::time_t when, int tz_minutes) {
  return Signature{.name = id.name,
                   .email = id.email,
                   .when = static_cast<std::int64_t>(when),
                   .tz_minutes = tz_minutes};
}

Signature now(const Identity &identity) {
  const std::time_t t = std::time(nullptr);
  return make_signature(identity, t, local_utc_offset_minutes(t));
}

void check_signature(const Signature &sig, std::string_view field) {
  const auto bad_char = [](const std::string &s) {
    return s.find_first_of("<>\n") != std::string::npos;
  };
  const auto is_ws = [](char c) { return c == ' ' || c == '\t'; };
  const std::string what(field);
  if (bad_char(sig.name) || bad_char(sig.email)) {
    throw std::invalid_argument(what + ": '<', '>' and newlines are not allowed in '" + sig.name +
                                " <" + sig.email + ">'");
  }
  if (!sig.name.empty() && (is_ws(sig.name.front()) || is_ws(sig.name.back()))) {
    throw std::invalid_argument(what + ": name '" + sig.name + "' has surrounding whitespace");
  }
  if (sig.tz_minutes <= -100 * 60 || sig.tz_minutes >= 100 * 60) {
    throw std::invalid_argument(what + ": timezone offset out of range");
  }
  if (sig.tz_negative_zero && sig.tz_minutes != 0) {
    throw std::invalid_argument(what + ": negative zero timezone with a non-zero offset");
  }
}

std::string format_signature(const Signature &sig) {
  check_signature(sig, "signature");
  return sig.name + " <" + sig.email + "> " + std::to_string(static_cast<long long>(sig.when)) +
         " " + tz_offset_string(sig.tz_minutes, sig.tz_negative_zero);
}

Signature parse_signature(std::string_view text, std::string_view field) {
  // Name may contain anything but '<'; the email is the last <...> pair.
  const auto lt = text.find('<');
  const auto gt = text.rfind('>');
  if (lt == std::string_view::npos || gt == std::string_view::npos || gt < lt) {
    throw DecodeError(field, "missing <email>");
  }
  Signature sig;
  std::string_view name = text.substr(0, lt);
  while (!name.empty() && name.back() == ' ') {
    name.remove_suffix(1);
  }
  sig.name = std::string(name);
  sig.email = std::string(text.substr(lt + 1, gt - lt - 1));

  std::string_view rest = text.substr(gt + 1);
  if (rest.empty() || rest.front() != ' ') {
    throw DecodeError(field, "missing timestamp");
  }
  rest.remove_prefix(1);
  const auto sp = rest.find(' ');
  if (sp == std::string_view::npos) {
    throw DecodeError(field, "missing timezone");
  }
  const std::string_view secs = rest.substr(0, sp);
  std::int64_t when = 0;
  const auto r = std::from_chars(secs.data(), secs.data() + secs.size(), when);
  if (secs.empty() || r.ec != std::errc{} || r.ptr != secs.data() + secs.size()) {
    throw DecodeError(field, "bad timestamp '" + std::string(secs) + "'");
  }
  sig.when = when;
  const std::string_view tz = rest.substr(sp + 1);
  sig.tz_minutes = parse_tz_offset(tz, field);
  sig.tz_negative_zero = tz == "-0000";
  return sig;
}

} // namespace gitstore::timeutil
