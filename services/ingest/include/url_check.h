#pragma once
#include <optional>
#include <string>

// Syntax-only check of a feed URL, no I/O.
// Returns std::nullopt when the URL is acceptable, otherwise the reason:
// empty, not parseable, scheme other than http/https, or missing host.
std::optional<std::string> check_feed_url(const std::string& url);
