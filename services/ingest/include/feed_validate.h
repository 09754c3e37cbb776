#pragma once
#include <optional>
#include <string>

#include "http_fetch.h"
#include "ingest_error.h"

struct ValidationResult {
  bool ok = false;
  std::optional<std::string> reason;
  ErrorClass error_class = ErrorClass::kNone;
};

// Decides whether a URL may be registered as a feed: syntax and scheme
// first, then a live fetch and parse. Never writes to any store.
class FeedValidator {
 public:
  explicit FeedValidator(HttpOptions opt, FetchFn fetch = http_get);

  ValidationResult validate(const std::string& url) const;

 private:
  HttpOptions opt_;
  FetchFn fetch_;
};
