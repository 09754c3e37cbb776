#pragma once
#include <map>
#include <mutex>
#include <utility>

#include "entity_store.h"

// Process-local EntityStore used by the CLI and the tests.
class MemoryStore : public EntityStore {
 public:
  MemoryStore() = default;

  Feed create_feed(const std::string& url) override;
  std::optional<Feed> get_feed(int64_t id) const override;
  std::optional<Feed> find_feed(const std::string& url) const override;
  std::vector<Feed> list_feeds() const override;
  void update_feed(const Feed& feed) override;
  bool set_feed_title_if_absent(int64_t id, const std::string& title) override;
  void set_feed_last_fetched(int64_t id, int64_t fetched_at_ms) override;
  bool delete_feed(int64_t id) override;

  bool item_exists(int64_t feed_id, const std::string& guid) const override;
  FeedItem create_item(const NewFeedItem& item) override;
  std::optional<FeedItem> get_item(int64_t id) const override;
  std::vector<FeedItem> list_items(const ItemFilter& filter) const override;
  size_t count_items(int64_t feed_id) const override;

  bool set_item_read(int64_t item_id, bool is_read) override;
  size_t mark_feed_read(int64_t feed_id) override;
  size_t mark_read(const ItemFilter& filter) override;

 private:
  bool matches(const FeedItem& item, const ItemFilter& filter) const;

  mutable std::mutex mu_;
  int64_t next_feed_id_ = 1;
  int64_t next_item_id_ = 1;
  std::map<int64_t, Feed> feeds_;
  std::map<int64_t, FeedItem> items_;
  std::map<std::pair<int64_t, std::string>, int64_t> guid_index_;  // (feed, guid) -> item id
};
