#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "entity_store.h"
#include "entry_extract.h"
#include "http_fetch.h"
#include "ingest_error.h"

// FETCHING -> PARSED -> (FAILED | EXTRACTING -> DEDUPING -> PERSISTING -> DONE)
enum class SyncState {
  kFetching,
  kParsed,
  kFailed,
  kExtracting,
  kDeduping,
  kPersisting,
  kDone,
};

enum class SkipReason {
  kExtractFailed,    // extractor threw
  kNoGuid,           // neither id nor link
  kDuplicateInFeed,  // guid repeated within the same fetch; first wins
  kAlreadyStored,    // found by item_exists
  kPersistConflict,  // UniqueViolation on insert (concurrent sync)
  kPersistFailed,    // any other StoreError on insert
};

const char* sync_state_name(SyncState s);
const char* skip_reason_name(SkipReason r);

struct EntrySkip {
  size_t index = 0;  // position in the fetched document
  SkipReason reason = SkipReason::kNoGuid;
  std::string guid;
  std::string detail;
};

struct SyncResult {
  int new_items = 0;
  std::optional<std::string> error;
  ErrorClass error_class = ErrorClass::kNone;
  SyncState state = SyncState::kFetching;
  size_t entries_seen = 0;
  std::vector<FeedItem> created;
  std::vector<EntrySkip> skipped;

  bool ok() const { return !error.has_value(); }
};

// Fetch-and-sync for one feed at a time. Calls for different feeds may run
// concurrently on separate FeedSyncer instances or on the same one; the
// store's (feed, guid) constraint settles races on the same feed.
class FeedSyncer {
 public:
  FeedSyncer(EntityStore& store, HttpOptions opt, FetchFn fetch = http_get,
             ExtractFn extract = extract_entry);

  // Fetches feed.url and stores entries not seen before. Feed fields are
  // written through the store's narrow setters, never from `feed` itself;
  // afterwards `feed` is reloaded from the store.
  SyncResult sync(Feed& feed) const;

  // Loads the feed first; an unknown id is an input error.
  SyncResult sync(int64_t feed_id) const;

 private:
  EntityStore& store_;
  HttpOptions opt_;
  FetchFn fetch_;
  ExtractFn extract_;
};
