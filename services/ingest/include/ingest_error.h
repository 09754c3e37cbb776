#pragma once
#include <absl/strings/str_cat.h>
#include <string>

#include "feed_parser.h"

// Feed-level failure classes surfaced by validate and sync. Per-entry
// problems never reach this level; they are recorded as skips.
enum class ErrorClass {
  kNone,
  kInput,      // bad URL, detected before any I/O
  kTransport,  // timeout, connection, redirects, non-2xx
  kParse,      // not XML, not a feed, or no title and no entries
  kStore,      // the entity store refused a feed-level read or write
};

inline const char* error_class_name(ErrorClass c) {
  switch (c) {
    case ErrorClass::kNone: return "none";
    case ErrorClass::kInput: return "input";
    case ErrorClass::kTransport: return "transport";
    case ErrorClass::kParse: return "parse";
    case ErrorClass::kStore: return "store";
  }
  return "none";
}

inline constexpr const char kNotAFeed[] = "not a recognizable feed";

// Class of an unusable ParseResult.
inline ErrorClass parse_failure_class(const ParseResult& r) {
  return r.transport ? ErrorClass::kTransport : ErrorClass::kParse;
}

// Reason for an unusable ParseResult.
inline std::string parse_failure_reason(const ParseResult& r) {
  if (r.status == ParseStatus::kFailed && r.error) return *r.error;
  if (r.status == ParseStatus::kTolerated && r.error) return absl::StrCat(kNotAFeed, ": ", *r.error);
  return kNotAFeed;
}
