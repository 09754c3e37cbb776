#pragma once
#include <absl/strings/string_view.h>
#include <cstdint>
#include <optional>

// Structured feed dates: RFC 822 as used by RSS (4-digit year, optional
// weekday and seconds, numeric or North American/UT zone names) and
// RFC 3339 / W3C-DTF as used by Atom. Returns epoch ms.
std::optional<int64_t> parse_date_strict(absl::string_view s);

// Everything parse_date_strict accepts plus the looser shapes found in
// the wild: 2-digit years, unknown zone names (taken as UTC), ISO dates
// without offset or time, asctime, "January 2, 2006".
std::optional<int64_t> parse_date_lenient(absl::string_view s);

int64_t now_ms();
