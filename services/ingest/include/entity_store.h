#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct Feed {
  int64_t id = 0;
  std::string url;                       // unique, immutable
  std::optional<std::string> title;      // filled on first successful fetch
  std::optional<int64_t> last_fetched_ms;
  int64_t added_at_ms = 0;               // immutable
};

struct FeedItem {
  int64_t id = 0;
  int64_t feed_id = 0;
  std::string guid;                      // unique per feed
  std::string title;
  std::string content;
  int64_t published_at_ms = 0;
  bool is_read = false;
  int64_t created_at_ms = 0;             // immutable
  std::string link;
  std::string author;
};

// What the orchestrator hands the store; ids and created_at are the
// store's to assign.
struct NewFeedItem {
  int64_t feed_id = 0;
  std::string guid;
  std::string title;
  std::string content;
  int64_t published_at_ms = 0;
  std::string link;
  std::string author;
};

struct ItemFilter {
  std::optional<int64_t> feed_id;
  std::optional<bool> is_read;
  std::string search;  // case-insensitive substring of title or content
};

class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Duplicate feed url, or duplicate (feed, guid).
class UniqueViolation : public StoreError {
 public:
  using StoreError::StoreError;
};

class NotFound : public StoreError {
 public:
  using StoreError::StoreError;
};

// Persistence contract for feeds and their items. Implementations must be
// safe to call from several threads; the (feed, guid) uniqueness check in
// create_item is the authoritative dedup guard.
class EntityStore {
 public:
  virtual ~EntityStore() = default;

  // Throws UniqueViolation if url is already registered.
  virtual Feed create_feed(const std::string& url) = 0;
  virtual std::optional<Feed> get_feed(int64_t id) const = 0;
  virtual std::optional<Feed> find_feed(const std::string& url) const = 0;
  virtual std::vector<Feed> list_feeds() const = 0;
  // Writes title and last_fetched_ms only. Throws NotFound.
  virtual void update_feed(const Feed& feed) = 0;
  // Sets the title only if the stored feed has none, checked atomically.
  // Returns whether it was written. Throws NotFound.
  virtual bool set_feed_title_if_absent(int64_t id, const std::string& title) = 0;
  // Throws NotFound.
  virtual void set_feed_last_fetched(int64_t id, int64_t fetched_at_ms) = 0;
  // Removes the feed and all of its items. Returns false if absent.
  virtual bool delete_feed(int64_t id) = 0;

  virtual bool item_exists(int64_t feed_id, const std::string& guid) const = 0;
  // Throws UniqueViolation for an existing (feed, guid), NotFound for an
  // unknown feed.
  virtual FeedItem create_item(const NewFeedItem& item) = 0;
  virtual std::optional<FeedItem> get_item(int64_t id) const = 0;
  // Newest first by published_at, then by id.
  virtual std::vector<FeedItem> list_items(const ItemFilter& filter) const = 0;
  virtual size_t count_items(int64_t feed_id) const = 0;

  // Read-status updates touch is_read only and report whether / how many
  // items changed.
  virtual bool set_item_read(int64_t item_id, bool is_read) = 0;
  virtual size_t mark_feed_read(int64_t feed_id) = 0;
  virtual size_t mark_read(const ItemFilter& filter) = 0;
};
