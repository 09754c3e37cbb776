#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "entity_store.h"
#include "feed_sync.h"
#include "feed_validate.h"
#include "http_fetch.h"

struct FeedReport {
  std::string url;
  std::optional<int64_t> feed_id;
  bool registered = false;  // feed was created during this run
  bool not_started = false; // stop was requested before this feed began
  std::optional<ValidationResult> validation;
  std::optional<SyncResult> sync;

  bool ok() const;
  std::optional<std::string> error() const;
};

// Validates, registers and syncs a batch of feed URLs on a fixed number of
// worker threads. Unknown URLs are validated before being registered;
// known ones are refreshed directly.
class IngestRunner {
 public:
  IngestRunner(EntityStore& store, HttpOptions opt, int max_concurrency,
               FetchFn fetch = http_get, ExtractFn extract = extract_entry);

  // Reports come back in the order of `urls`. Workers check `stop`
  // before picking up each feed.
  std::vector<FeedReport> run(const std::vector<std::string>& urls,
                              const std::atomic<bool>& stop) const;
  std::vector<FeedReport> run(const std::vector<std::string>& urls) const;

  // Validation only; the store is not touched.
  std::vector<FeedReport> validate_all(const std::vector<std::string>& urls,
                                       const std::atomic<bool>& stop) const;

 private:
  template <typename Fn>
  std::vector<FeedReport> fan_out(const std::vector<std::string>& urls,
                                  const std::atomic<bool>& stop, Fn fn) const;
  FeedReport ingest_one(const std::string& url) const;

  EntityStore& store_;
  int max_concurrency_;
  FeedValidator validator_;
  FeedSyncer syncer_;
};
