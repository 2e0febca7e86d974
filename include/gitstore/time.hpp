#pragma once
#include "gitstore/config.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace gitstore {

// Identity plus the moment it acted: "Name <email> 1714412345 +0300".
struct Signature {
  std::string name;
  std::string email;
  std::int64_t when = 0; // seconds since the epoch
  int tz_minutes = 0;    // minutes east of UTC
  // Git writes "-0000" for an unknown zone; kept so the bytes read back the same.
  bool tz_negative_zero = false;

  bool operator==(const Signature &) const = default;
};

namespace timeutil {

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700").
// `negative_zero` turns an offset of 0 into "-0000".
auto tz_offset_string(int minutes, bool negative_zero = false) -> std::string;

// Parse ±HHMM with MM < 60; throws DecodeError(field) if malformed.
auto parse_tz_offset(std::string_view text, std::string_view field) -> int;

auto make_signature(const Identity &identity, std::time_t when, int tz_minutes) -> Signature;

// Signature for `identity` at the current local time.
auto now(const Identity &identity) -> Signature;

// Throws std::invalid_argument if `sig` would not parse back unchanged: '<', '>'
// or a newline in name or email, whitespace around the name, or |tz| >= 100h.
void check_signature(const Signature &sig, std::string_view field);

// "Name <email> <seconds> <tz>"; runs check_signature first.
auto format_signature(const Signature &sig) -> std::string;

// Parse "Name <email> <seconds> <tz>"; `field` names the header for errors.
auto parse_signature(std::string_view text, std::string_view field) -> Signature;

} // namespace timeutil

} // namespace gitstore
