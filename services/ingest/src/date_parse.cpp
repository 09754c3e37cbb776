#include "date_parse.h"
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <string>
#include <vector>

struct ZoneName {
  const char* name;
  const char* offset;
};

// RFC 822 section 5.1 zone names.
constexpr ZoneName kZones[] = {
    {"GMT", "+0000"}, {"UT", "+0000"},  {"UTC", "+0000"}, {"Z", "+0000"},
    {"EST", "-0500"}, {"EDT", "-0400"}, {"CST", "-0600"}, {"CDT", "-0500"},
    {"MST", "-0700"}, {"MDT", "-0600"}, {"PST", "-0800"}, {"PDT", "-0700"},
};

constexpr const char* kRfc822Formats[] = {
    "%d %b %E4Y %H:%M:%S %z",
    "%d %b %E4Y %H:%M %z",
};

constexpr const char* kRfc3339Formats[] = {
    "%Y-%m-%d%ET%H:%M:%E*S%Ez",
    "%Y-%m-%d%ET%H:%M:%E*S%z",
    "%Y-%m-%d%ET%H:%M%Ez",
};

// Inputs here have no zone, or had an unknown zone name dropped: read as UTC.
constexpr const char* kLooseFormats[] = {
    "%d %b %y %H:%M:%S %z",
    "%d %b %y %H:%M %z",
    "%d %b %E4Y %H:%M:%S",
    "%d %b %E4Y %H:%M",
    "%d %b %E4Y",
    "%Y-%m-%d%ET%H:%M:%E*S",
    "%Y-%m-%d %H:%M:%E*S%Ez",
    "%Y-%m-%d %H:%M:%E*S %z",
    "%Y-%m-%d %H:%M:%E*S",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%d",
    "%Y/%m/%d %H:%M:%S",
    "%Y/%m/%d",
    "%a %b %d %H:%M:%S %z %Y",
    "%a %b %d %H:%M:%S %Y",
    "%B %d, %Y %H:%M:%S",
    "%B %d, %Y",
};

static bool all_alpha(absl::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!absl::ascii_isalpha(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

static std::optional<int64_t> try_formats(const char* const* formats, size_t n, absl::string_view s) {
  for (size_t i = 0; i < n; ++i) {
    absl::Time t;
    std::string err;
    if (!absl::ParseTime(formats[i], s, &t, &err)) continue;
    if (t == absl::InfiniteFuture() || t == absl::InfinitePast()) continue;
    return absl::ToUnixMillis(t);
  }
  return std::nullopt;
}

template <size_t N>
static std::optional<int64_t> try_formats(const char* const (&formats)[N], absl::string_view s) {
  return try_formats(formats, N, s);
}

// Collapses whitespace, drops a leading "Mon," weekday and rewrites a
// trailing zone name to its numeric offset. An unknown trailing zone
// name is reported through *unknown_zone and left in place.
static std::string normalize_rfc822(absl::string_view in, bool* unknown_zone) {
  std::vector<std::string> tokens = absl::StrSplit(in, ' ', absl::SkipWhitespace());
  if (!tokens.empty()) {
    absl::string_view first = tokens.front();
    if (first.size() > 1 && first.back() == ',' && all_alpha(first.substr(0, first.size() - 1))) {
      tokens.erase(tokens.begin());
    }
  }
  *unknown_zone = false;
  if (tokens.size() >= 2 && all_alpha(tokens.back())) {
    std::string zone = absl::AsciiStrToUpper(tokens.back());
    bool known = false;
    for (const auto& z : kZones) {
      if (zone == z.name) {
        tokens.back() = z.offset;
        known = true;
        break;
      }
    }
    *unknown_zone = !known;
  }
  return absl::StrJoin(tokens, " ");
}

std::optional<int64_t> parse_date_strict(absl::string_view s) {
  s = absl::StripAsciiWhitespace(s);
  if (s.empty()) return std::nullopt;

  if (auto t = try_formats(kRfc3339Formats, s)) return t;

  bool unknown_zone = false;
  std::string norm = normalize_rfc822(s, &unknown_zone);
  if (unknown_zone) return std::nullopt;
  return try_formats(kRfc822Formats, norm);
}

std::optional<int64_t> parse_date_lenient(absl::string_view s) {
  s = absl::StripAsciiWhitespace(s);
  if (s.empty()) return std::nullopt;

  if (auto t = parse_date_strict(s)) return t;

  bool unknown_zone = false;
  std::string norm = normalize_rfc822(s, &unknown_zone);
  if (unknown_zone) {
    // "02 Jan 2006 15:04:05 CEST": keep the wall clock, drop the zone.
    norm = norm.substr(0, norm.rfind(' '));
  }
  if (auto t = try_formats(kLooseFormats, norm)) return t;
  if (norm != s) return try_formats(kLooseFormats, s);
  return std::nullopt;
}

int64_t now_ms() {
  return absl::ToUnixMillis(absl::Now());
}
