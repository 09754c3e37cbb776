#include "ingest_runner.h"
#include <fmt/core.h>
#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

bool FeedReport::ok() const {
  if (not_started) return false;
  if (validation && !validation->ok) return false;
  if (sync && !sync->ok()) return false;
  return validation.has_value() || sync.has_value();
}

std::optional<std::string> FeedReport::error() const {
  if (not_started) return std::string("not started: stop requested");
  if (validation && !validation->ok) return validation->reason;
  if (sync && !sync->ok()) return sync->error;
  return std::nullopt;
}

IngestRunner::IngestRunner(EntityStore& store, HttpOptions opt, int max_concurrency, FetchFn fetch,
                           ExtractFn extract)
    : store_(store),
      max_concurrency_(std::max(1, max_concurrency)),
      validator_(opt, fetch),
      syncer_(store, opt, fetch, std::move(extract)) {}

// Report for a feed whose worker raised; the batch carries on.
static FeedReport crashed(const std::string& url, const std::string& what) {
  fmt::print(stderr, "[ingest] ERROR feed aborted url={}: {}\n", url, what);
  FeedReport r;
  r.url = url;
  r.sync = SyncResult{};
  r.sync->state = SyncState::kFailed;
  r.sync->error = std::string("unexpected error: ") + what;
  r.sync->error_class = ErrorClass::kStore;
  return r;
}

template <typename Fn>
std::vector<FeedReport> IngestRunner::fan_out(const std::vector<std::string>& urls,
                                              const std::atomic<bool>& stop, Fn fn) const {
  std::vector<FeedReport> reports(urls.size());
  for (size_t i = 0; i < urls.size(); ++i) {
    reports[i].url = urls[i];
    reports[i].not_started = true;
  }
  if (urls.empty()) return reports;

  http_global_init();

  std::atomic<size_t> next{0};
  auto worker = [&]() {
    while (!stop.load()) {
      size_t i = next.fetch_add(1);
      if (i >= urls.size()) break;
      try {
        reports[i] = fn(urls[i]);
      } catch (const std::exception& e) {
        reports[i] = crashed(urls[i], e.what());
      } catch (...) {
        reports[i] = crashed(urls[i], "unknown exception");
      }
    }
  };

  size_t n = std::min(urls.size(), static_cast<size_t>(max_concurrency_));
  std::vector<std::thread> workers;
  workers.reserve(n);
  for (size_t t = 0; t < n; ++t) workers.emplace_back(worker);
  for (auto& th : workers) th.join();

  if (stop.load()) {
    size_t pending = std::count_if(reports.begin(), reports.end(),
                                   [](const FeedReport& r) { return r.not_started; });
    fmt::print(stderr, "[ingest] WARN stop requested, {} feed(s) not started\n", pending);
  }
  return reports;
}

FeedReport IngestRunner::ingest_one(const std::string& url) const {
  FeedReport r;
  r.url = url;

  std::optional<Feed> feed;
  try {
    feed = store_.find_feed(url);
  } catch (const StoreError& e) {
    fmt::print(stderr, "[ingest] ERROR lookup failed url={}: {}\n", url, e.what());
    r.sync = SyncResult{};
    r.sync->state = SyncState::kFailed;
    r.sync->error = std::string("store lookup failed: ") + e.what();
    r.sync->error_class = ErrorClass::kStore;
    return r;
  }

  if (!feed) {
    r.validation = validator_.validate(url);
    if (!r.validation->ok) return r;
    bool taken = false;
    try {
      feed = store_.create_feed(url);
      r.registered = true;
      fmt::print(stderr, "[ingest] registered feed={} url={}\n", feed->id, url);
    } catch (const UniqueViolation&) {
      // Registered by another worker (same URL listed twice).
      taken = true;
    } catch (const StoreError& e) {
      fmt::print(stderr, "[ingest] ERROR could not register url={}: {}\n", url, e.what());
    }
    if (taken) {
      try {
        feed = store_.find_feed(url);
      } catch (const StoreError& e) {
        fmt::print(stderr, "[ingest] ERROR lookup failed url={}: {}\n", url, e.what());
      }
    }
    if (!feed) {
      r.sync = SyncResult{};
      r.sync->state = SyncState::kFailed;
      r.sync->error = std::string("could not register feed");
      r.sync->error_class = ErrorClass::kStore;
      return r;
    }
  }

  r.feed_id = feed->id;
  r.sync = syncer_.sync(*feed);
  return r;
}

std::vector<FeedReport> IngestRunner::run(const std::vector<std::string>& urls,
                                          const std::atomic<bool>& stop) const {
  return fan_out(urls, stop, [this](const std::string& url) { return ingest_one(url); });
}

std::vector<FeedReport> IngestRunner::run(const std::vector<std::string>& urls) const {
  std::atomic<bool> never{false};
  return run(urls, never);
}

std::vector<FeedReport> IngestRunner::validate_all(const std::vector<std::string>& urls,
                                                   const std::atomic<bool>& stop) const {
  return fan_out(urls, stop, [this](const std::string& url) {
    FeedReport r;
    r.url = url;
    r.validation = validator_.validate(url);
    return r;
  });
}
