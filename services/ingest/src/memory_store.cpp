#include "memory_store.h"
#include "date_parse.h"
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <algorithm>

Feed MemoryStore::create_feed(const std::string& url) {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& kv : feeds_) {
    if (kv.second.url == url) throw UniqueViolation(absl::StrCat("feed already exists: ", url));
  }
  Feed f;
  f.id = next_feed_id_++;
  f.url = url;
  f.added_at_ms = now_ms();
  feeds_.emplace(f.id, f);
  return f;
}

std::optional<Feed> MemoryStore::get_feed(int64_t id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = feeds_.find(id);
  if (it == feeds_.end()) return std::nullopt;
  return it->second;
}

std::optional<Feed> MemoryStore::find_feed(const std::string& url) const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& kv : feeds_) {
    if (kv.second.url == url) return kv.second;
  }
  return std::nullopt;
}

std::vector<Feed> MemoryStore::list_feeds() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Feed> out;
  out.reserve(feeds_.size());
  for (const auto& kv : feeds_) out.push_back(kv.second);
  return out;
}

void MemoryStore::update_feed(const Feed& feed) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = feeds_.find(feed.id);
  if (it == feeds_.end()) throw NotFound(absl::StrCat("no feed with id ", feed.id));
  it->second.title = feed.title;
  it->second.last_fetched_ms = feed.last_fetched_ms;
}

bool MemoryStore::set_feed_title_if_absent(int64_t id, const std::string& title) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = feeds_.find(id);
  if (it == feeds_.end()) throw NotFound(absl::StrCat("no feed with id ", id));
  if (it->second.title) return false;
  it->second.title = title;
  return true;
}

void MemoryStore::set_feed_last_fetched(int64_t id, int64_t fetched_at_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = feeds_.find(id);
  if (it == feeds_.end()) throw NotFound(absl::StrCat("no feed with id ", id));
  it->second.last_fetched_ms = fetched_at_ms;
}

bool MemoryStore::delete_feed(int64_t id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (feeds_.erase(id) == 0) return false;
  for (auto it = items_.begin(); it != items_.end();) {
    if (it->second.feed_id == id) {
      guid_index_.erase({id, it->second.guid});
      it = items_.erase(it);
    } else {
      ++it;
    }
  }
  return true;
}

bool MemoryStore::item_exists(int64_t feed_id, const std::string& guid) const {
  std::lock_guard<std::mutex> lock(mu_);
  return guid_index_.count({feed_id, guid}) > 0;
}

FeedItem MemoryStore::create_item(const NewFeedItem& in) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!feeds_.count(in.feed_id)) throw NotFound(absl::StrCat("no feed with id ", in.feed_id));
  auto key = std::make_pair(in.feed_id, in.guid);
  if (guid_index_.count(key)) {
    throw UniqueViolation(absl::StrCat("item already exists: feed=", in.feed_id, " guid=", in.guid));
  }

  FeedItem item;
  item.id = next_item_id_++;
  item.feed_id = in.feed_id;
  item.guid = in.guid;
  item.title = in.title;
  item.content = in.content;
  item.published_at_ms = in.published_at_ms;
  item.created_at_ms = now_ms();
  item.link = in.link;
  item.author = in.author;

  guid_index_.emplace(std::move(key), item.id);
  items_.emplace(item.id, item);
  return item;
}

std::optional<FeedItem> MemoryStore::get_item(int64_t id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = items_.find(id);
  if (it == items_.end()) return std::nullopt;
  return it->second;
}

static bool contains_ci(const std::string& haystack, const std::string& needle_lower) {
  return absl::StrContains(absl::AsciiStrToLower(haystack), needle_lower);
}

bool MemoryStore::matches(const FeedItem& item, const ItemFilter& filter) const {
  if (filter.feed_id && item.feed_id != *filter.feed_id) return false;
  if (filter.is_read && item.is_read != *filter.is_read) return false;
  if (!filter.search.empty()) {
    const std::string needle = absl::AsciiStrToLower(filter.search);
    if (!contains_ci(item.title, needle) && !contains_ci(item.content, needle)) return false;
  }
  return true;
}

std::vector<FeedItem> MemoryStore::list_items(const ItemFilter& filter) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<FeedItem> out;
  for (const auto& kv : items_) {
    if (matches(kv.second, filter)) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const FeedItem& a, const FeedItem& b) {
    if (a.published_at_ms != b.published_at_ms) return a.published_at_ms > b.published_at_ms;
    return a.id > b.id;
  });
  return out;
}

size_t MemoryStore::count_items(int64_t feed_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::count_if(items_.begin(), items_.end(),
                       [feed_id](const auto& kv) { return kv.second.feed_id == feed_id; });
}

bool MemoryStore::set_item_read(int64_t item_id, bool is_read) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = items_.find(item_id);
  if (it == items_.end() || it->second.is_read == is_read) return false;
  it->second.is_read = is_read;
  return true;
}

size_t MemoryStore::mark_feed_read(int64_t feed_id) {
  ItemFilter f;
  f.feed_id = feed_id;
  f.is_read = false;
  return mark_read(f);
}

size_t MemoryStore::mark_read(const ItemFilter& filter) {
  std::lock_guard<std::mutex> lock(mu_);
  size_t changed = 0;
  for (auto& kv : items_) {
    if (kv.second.is_read || !matches(kv.second, filter)) continue;
    kv.second.is_read = true;
    ++changed;
  }
  return changed;
}
