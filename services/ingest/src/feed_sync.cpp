#include "feed_sync.h"
#include "date_parse.h"
#include "feed_parser.h"
#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_cat.h>
#include <fmt/core.h>
#include <exception>
#include <utility>

constexpr size_t kMaxTitleBytes = 255;

// Cuts at most `max` bytes without splitting a UTF-8 sequence.
static std::string clip_utf8(std::string s, size_t max) {
  if (s.size() <= max) return s;
  size_t cut = max;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  s.resize(cut);
  return s;
}

static SyncResult fail(SyncResult r, ErrorClass cls, std::string reason) {
  r.state = SyncState::kFailed;
  r.error_class = cls;
  r.error = std::move(reason);
  r.new_items = 0;
  return r;
}

struct Staged {
  size_t index;
  NewFeedItem item;
};

const char* sync_state_name(SyncState s) {
  switch (s) {
    case SyncState::kFetching: return "FETCHING";
    case SyncState::kParsed: return "PARSED";
    case SyncState::kFailed: return "FAILED";
    case SyncState::kExtracting: return "EXTRACTING";
    case SyncState::kDeduping: return "DEDUPING";
    case SyncState::kPersisting: return "PERSISTING";
    case SyncState::kDone: return "DONE";
  }
  return "FAILED";
}

const char* skip_reason_name(SkipReason r) {
  switch (r) {
    case SkipReason::kExtractFailed: return "extract-failed";
    case SkipReason::kNoGuid: return "no-guid";
    case SkipReason::kDuplicateInFeed: return "duplicate-in-feed";
    case SkipReason::kAlreadyStored: return "already-stored";
    case SkipReason::kPersistConflict: return "persist-conflict";
    case SkipReason::kPersistFailed: return "persist-failed";
  }
  return "persist-failed";
}

FeedSyncer::FeedSyncer(EntityStore& store, HttpOptions opt, FetchFn fetch, ExtractFn extract)
    : store_(store), opt_(std::move(opt)), fetch_(std::move(fetch)), extract_(std::move(extract)) {}

SyncResult FeedSyncer::sync(int64_t feed_id) const {
  std::optional<Feed> feed;
  try {
    feed = store_.get_feed(feed_id);
  } catch (const StoreError& e) {
    return fail(SyncResult{}, ErrorClass::kStore, absl::StrCat("could not load feed: ", e.what()));
  }
  if (!feed) return fail(SyncResult{}, ErrorClass::kInput, absl::StrCat("no feed with id ", feed_id));
  return sync(*feed);
}

SyncResult FeedSyncer::sync(Feed& feed) const {
  SyncResult res;

  // FETCHING -> PARSED
  ParseResult parsed;
  try {
    parsed = parse_feed_url(feed.url, opt_, fetch_);
  } catch (const std::exception& e) {
    fmt::print(stderr, "[feed_sync] ERROR fetch raised feed={} url={}: {}\n", feed.id, feed.url, e.what());
    return fail(std::move(res), ErrorClass::kTransport, absl::StrCat("unexpected error: ", e.what()));
  } catch (...) {
    fmt::print(stderr, "[feed_sync] ERROR fetch raised feed={} url={}: unknown exception\n", feed.id, feed.url);
    return fail(std::move(res), ErrorClass::kTransport, "unexpected error: unknown exception");
  }
  res.state = SyncState::kParsed;
  res.entries_seen = parsed.entries.size();

  if (!parsed.usable()) {
    std::string reason = parse_failure_reason(parsed);
    fmt::print(stderr, "[feed_sync] WARN sync failed feed={} url={}: {}\n", feed.id, feed.url, reason);
    return fail(std::move(res), parse_failure_class(parsed), std::move(reason));
  }
  if (parsed.status == ParseStatus::kTolerated) {
    fmt::print(stderr, "[feed_sync] WARN feed parsed with errors feed={} url={}: {}\n", feed.id,
               feed.url, parsed.error.value_or(""));
  }

  // The stored record decides whether a title is still missing; `feed` may
  // be an older snapshot.
  if (parsed.title) {
    try {
      store_.set_feed_title_if_absent(feed.id, clip_utf8(*parsed.title, kMaxTitleBytes));
    } catch (const StoreError& e) {
      fmt::print(stderr, "[feed_sync] WARN could not set title feed={}: {}\n", feed.id, e.what());
    }
  }

  // EXTRACTING -> DEDUPING
  std::vector<Staged> staged;
  absl::flat_hash_set<std::string> staged_guids;
  const int64_t fetched_at = now_ms();

  for (size_t i = 0; i < parsed.entries.size(); ++i) {
    res.state = SyncState::kExtracting;
    ExtractedItem x;
    try {
      x = extract_(parsed.entries[i]);
    } catch (const std::exception& e) {
      fmt::print(stderr, "[feed_sync] WARN skipping entry {} feed={}: extraction failed: {}\n", i,
                 feed.id, e.what());
      res.skipped.push_back(EntrySkip{i, SkipReason::kExtractFailed, "", e.what()});
      continue;
    } catch (...) {
      fmt::print(stderr, "[feed_sync] WARN skipping entry {} feed={}: extraction failed: unknown exception\n",
                 i, feed.id);
      res.skipped.push_back(EntrySkip{i, SkipReason::kExtractFailed, "", "unknown exception"});
      continue;
    }

    res.state = SyncState::kDeduping;
    if (!x.guid) {
      fmt::print(stderr, "[feed_sync] WARN skipping entry without guid feed={} title='{}'\n", feed.id,
                 x.title);
      res.skipped.push_back(EntrySkip{i, SkipReason::kNoGuid, "", x.title});
      continue;
    }
    const std::string& guid = *x.guid;
    if (staged_guids.contains(guid)) {
      res.skipped.push_back(EntrySkip{i, SkipReason::kDuplicateInFeed, guid, ""});
      continue;
    }

    bool exists = false;
    try {
      exists = store_.item_exists(feed.id, guid);
    } catch (const StoreError& e) {
      // Leave it to the insert's uniqueness check.
      fmt::print(stderr, "[feed_sync] WARN existence check failed feed={} guid={}: {}\n", feed.id,
                 guid, e.what());
    }
    if (exists) {
      res.skipped.push_back(EntrySkip{i, SkipReason::kAlreadyStored, guid, ""});
      continue;
    }

    NewFeedItem item;
    item.feed_id = feed.id;
    item.guid = guid;
    item.title = clip_utf8(std::move(x.title), kMaxTitleBytes);
    item.content = std::move(x.content);
    item.published_at_ms = x.published_ms.value_or(fetched_at);
    item.link = std::move(x.link);
    item.author = std::move(x.author);
    staged_guids.insert(guid);
    staged.push_back(Staged{i, std::move(item)});
  }

  // PERSISTING
  res.state = SyncState::kPersisting;
  for (auto& s : staged) {
    try {
      res.created.push_back(store_.create_item(s.item));
    } catch (const UniqueViolation& e) {
      res.skipped.push_back(EntrySkip{s.index, SkipReason::kPersistConflict, s.item.guid, e.what()});
    } catch (const StoreError& e) {
      fmt::print(stderr, "[feed_sync] ERROR could not store item feed={} guid={}: {}\n", feed.id,
                 s.item.guid, e.what());
      res.skipped.push_back(EntrySkip{s.index, SkipReason::kPersistFailed, s.item.guid, e.what()});
    }
  }
  res.new_items = static_cast<int>(res.created.size());

  if (res.new_items > 0) {
    try {
      store_.set_feed_last_fetched(feed.id, now_ms());
    } catch (const StoreError& e) {
      fmt::print(stderr, "[feed_sync] WARN could not set last_fetched feed={}: {}\n", feed.id, e.what());
    }
  }

  try {
    if (auto stored = store_.get_feed(feed.id)) feed = *stored;
  } catch (const StoreError& e) {
    fmt::print(stderr, "[feed_sync] WARN could not reload feed={}: {}\n", feed.id, e.what());
  }

  res.state = SyncState::kDone;
  fmt::print(stderr, "[feed_sync] feed={} url={} entries={} new={} skipped={}\n", feed.id, feed.url,
             res.entries_seen, res.new_items, res.skipped.size());
  return res;
}
