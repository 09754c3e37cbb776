#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "config.h"
#include "feed_sync.h"
#include "ingest_runner.h"
#include "memory_store.h"

static std::atomic<bool> g_stop{false};
static void handle_sigint(int) { g_stop.store(true); }

static nlohmann::json report_json(const FeedReport& r) {
  nlohmann::json j;
  j["url"] = r.url;
  j["ok"] = r.ok();
  if (auto err = r.error()) j["error"] = *err;
  if (r.feed_id) j["feed_id"] = *r.feed_id;
  j["registered"] = r.registered;

  if (r.validation) {
    j["validation"] = {{"ok", r.validation->ok},
                       {"error_class", error_class_name(r.validation->error_class)}};
    if (r.validation->reason) j["validation"]["reason"] = *r.validation->reason;
  }
  if (r.sync) {
    const SyncResult& s = *r.sync;
    nlohmann::json sj = {{"state", sync_state_name(s.state)},
                         {"new_items", s.new_items},
                         {"entries_seen", s.entries_seen},
                         {"error_class", error_class_name(s.error_class)}};
    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& k : s.skipped) {
      skipped.push_back({{"index", k.index}, {"reason", skip_reason_name(k.reason)}, {"guid", k.guid}});
    }
    sj["skipped"] = std::move(skipped);
    j["sync"] = std::move(sj);
  }
  return j;
}

static void usage() {
  fmt::print(stderr, "usage: feedsync [config/ingest.yml] [--validate-only]\n");
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_sigint);
  std::signal(SIGTERM, handle_sigint);

  std::string cfg_path = "config/ingest.yml";
  bool validate_only = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--validate-only") validate_only = true;
    else if (arg == "-h" || arg == "--help") { usage(); return 0; }
    else if (!arg.empty() && arg[0] == '-') { usage(); return 2; }
    else cfg_path = arg;
  }

  IngestConfig cfg;
  try {
    fmt::print(stderr, "[feedsync] Loading config: '{}'\n", cfg_path);
    cfg = load_ingest_config(cfg_path);
  } catch (const std::exception& e) {
    fmt::print(stderr, "[feedsync] ERROR {}\n", e.what());
    return 2;
  }

  MemoryStore store;
  IngestRunner runner(store, cfg.http, cfg.ingest.max_concurrency, http_get,
                      entry_extractor(cfg.ingest.placeholder_title));

  fmt::print(stderr, "[feedsync] {} {} feed(s), concurrency={} timeout={}s max_redirects={}\n",
             validate_only ? "Validating" : "Ingesting", cfg.feeds.size(),
             cfg.ingest.max_concurrency, cfg.http.timeout_secs, cfg.http.max_redirects);

  std::vector<FeedReport> reports =
      validate_only ? runner.validate_all(cfg.feeds, g_stop) : runner.run(cfg.feeds, g_stop);

  int failed = 0;
  int created = 0;
  for (const auto& r : reports) {
    if (!r.ok()) ++failed;
    if (r.sync) created += r.sync->new_items;
    std::cout << report_json(r).dump() << "\n";
  }
  std::cout.flush();

  fmt::print(stderr, "[feedsync] Done. feeds={} failed={} new_items={}\n", reports.size(), failed, created);
  return failed == 0 ? 0 : 1;
}
