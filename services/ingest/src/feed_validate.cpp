#include "feed_validate.h"
#include "feed_parser.h"
#include "url_check.h"
#include <absl/strings/str_cat.h>
#include <fmt/core.h>
#include <exception>
#include <utility>

static ValidationResult reject(ErrorClass cls, std::string reason) {
  ValidationResult r;
  r.ok = false;
  r.reason = std::move(reason);
  r.error_class = cls;
  return r;
}

FeedValidator::FeedValidator(HttpOptions opt, FetchFn fetch)
    : opt_(std::move(opt)), fetch_(std::move(fetch)) {}

ValidationResult FeedValidator::validate(const std::string& url) const {
  if (auto bad = check_feed_url(url)) {
    fmt::print(stderr, "[feed_validate] WARN rejected url='{}': {}\n", url, *bad);
    return reject(ErrorClass::kInput, *bad);
  }

  ParseResult parsed;
  try {
    parsed = parse_feed_url(url, opt_, fetch_);
  } catch (const std::exception& e) {
    fmt::print(stderr, "[feed_validate] ERROR unexpected error url={}: {}\n", url, e.what());
    return reject(ErrorClass::kTransport, absl::StrCat("unexpected error: ", e.what()));
  } catch (...) {
    fmt::print(stderr, "[feed_validate] ERROR unexpected error url={}: unknown exception\n", url);
    return reject(ErrorClass::kTransport, "unexpected error: unknown exception");
  }

  if (!parsed.usable()) {
    std::string reason = parse_failure_reason(parsed);
    fmt::print(stderr, "[feed_validate] WARN not a valid feed url={}: {}\n", url, reason);
    return reject(parse_failure_class(parsed), std::move(reason));
  }

  if (parsed.status == ParseStatus::kTolerated) {
    fmt::print(stderr, "[feed_validate] WARN feed parsed with errors url={}: {}\n", url,
               parsed.error.value_or(""));
  }
  fmt::print(stderr, "[feed_validate] ok url={} title='{}' entries={}\n", url,
             parsed.title.value_or(""), parsed.entries.size());
  return ValidationResult{true, std::nullopt, ErrorClass::kNone};
}
