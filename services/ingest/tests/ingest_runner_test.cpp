#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_web.h"
#include "ingest_runner.h"
#include "memory_store.h"

namespace {

std::string feed_with(const std::string& guid) {
  return "<rss version=\"2.0\"><channel><title>T</title><item><guid>" + guid +
         "</guid><title>x</title></item></channel></rss>";
}

TEST(IngestRunner, ReportsFollowInputOrder) {
  MemoryStore store;
  FakeWeb web;
  std::vector<std::string> urls;
  for (int i = 0; i < 8; ++i) {
    urls.push_back("https://f" + std::to_string(i) + ".example/rss");
    web.serve(urls.back(), feed_with("g" + std::to_string(i)));
  }

  std::vector<FeedReport> reports = IngestRunner(store, HttpOptions{}, 3, web.fn()).run(urls);
  ASSERT_EQ(reports.size(), urls.size());
  for (size_t i = 0; i < urls.size(); ++i) {
    EXPECT_EQ(reports[i].url, urls[i]);
    EXPECT_TRUE(reports[i].ok()) << urls[i];
    EXPECT_TRUE(reports[i].registered);
    ASSERT_TRUE(reports[i].sync);
    EXPECT_EQ(reports[i].sync->new_items, 1);
  }
  EXPECT_EQ(store.list_feeds().size(), 8u);
}

TEST(IngestRunner, InvalidFeedIsNotRegistered) {
  MemoryStore store;
  FakeWeb web;
  web.serve("https://good.example/rss", feed_with("a"));
  web.serve("https://page.example/", "<html><body/></html>");

  std::vector<FeedReport> reports = IngestRunner(store, HttpOptions{}, 2, web.fn())
      .run({"https://good.example/rss", "https://page.example/", "gopher://old.example/"});
  ASSERT_EQ(reports.size(), 3u);
  EXPECT_TRUE(reports[0].ok());
  EXPECT_FALSE(reports[1].ok());
  EXPECT_FALSE(reports[1].sync);
  EXPECT_EQ(reports[1].validation->error_class, ErrorClass::kParse);
  EXPECT_EQ(reports[2].validation->error_class, ErrorClass::kInput);
  EXPECT_TRUE(reports[2].error().has_value());
  EXPECT_EQ(store.list_feeds().size(), 1u);
}

TEST(IngestRunner, KnownFeedIsRefreshedWithoutValidation) {
  MemoryStore store;
  FakeWeb web;
  web.serve("https://a.example/rss", feed_with("a"));
  IngestRunner runner(store, HttpOptions{}, 1, web.fn());

  runner.run({"https://a.example/rss"});
  std::vector<FeedReport> again = runner.run({"https://a.example/rss"});
  ASSERT_EQ(again.size(), 1u);
  EXPECT_FALSE(again[0].registered);
  EXPECT_FALSE(again[0].validation);
  EXPECT_EQ(again[0].sync->new_items, 0);
  // validate + sync, then sync
  EXPECT_EQ(web.calls("https://a.example/rss"), 3);
}

TEST(IngestRunner, SameUrlTwiceRegistersOnce) {
  MemoryStore store;
  FakeWeb web;
  web.serve("https://a.example/rss", feed_with("a"));
  std::vector<FeedReport> reports = IngestRunner(store, HttpOptions{}, 2, web.fn())
      .run({"https://a.example/rss", "https://a.example/rss"});
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_TRUE(reports[0].ok());
  EXPECT_TRUE(reports[1].ok());
  EXPECT_EQ(store.list_feeds().size(), 1u);
  EXPECT_EQ(store.count_items(store.list_feeds()[0].id), 1u);
  EXPECT_EQ(reports[0].sync->new_items + reports[1].sync->new_items, 1);
}

TEST(IngestRunner, StopBeforeStartLeavesEverythingNotStarted) {
  MemoryStore store;
  FakeWeb web;
  std::atomic<bool> stop{true};
  std::vector<FeedReport> reports = IngestRunner(store, HttpOptions{}, 2, web.fn())
      .run({"https://a.example/rss", "https://b.example/rss"}, stop);
  ASSERT_EQ(reports.size(), 2u);
  for (const auto& r : reports) {
    EXPECT_TRUE(r.not_started);
    EXPECT_FALSE(r.ok());
  }
  EXPECT_EQ(web.total_calls(), 0);
}

TEST(IngestRunner, ValidateAllDoesNotWrite) {
  MemoryStore store;
  FakeWeb web;
  web.serve("https://a.example/rss", feed_with("a"));
  std::atomic<bool> stop{false};
  std::vector<FeedReport> reports = IngestRunner(store, HttpOptions{}, 2, web.fn())
      .validate_all({"https://a.example/rss", "https://missing.example/rss"}, stop);
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_TRUE(reports[0].ok());
  EXPECT_FALSE(reports[1].ok());
  EXPECT_EQ(reports[1].validation->error_class, ErrorClass::kTransport);
  EXPECT_TRUE(store.list_feeds().empty());
}

// Lookup blows up with something that is not a StoreError.
class BrokenLookupStore : public MemoryStore {
 public:
  std::optional<Feed> find_feed(const std::string& url) const override {
    if (url == "https://broken.example/rss") throw std::logic_error("lookup exploded");
    return MemoryStore::find_feed(url);
  }
};

TEST(IngestRunner, UnexpectedThrowFailsOnlyThatFeed) {
  BrokenLookupStore store;
  FakeWeb web;
  web.serve("https://a.example/rss", feed_with("a"));
  std::vector<FeedReport> reports = IngestRunner(store, HttpOptions{}, 2, web.fn())
      .run({"https://broken.example/rss", "https://a.example/rss"});
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_FALSE(reports[0].ok());
  EXPECT_EQ(reports[0].url, "https://broken.example/rss");
  ASSERT_TRUE(reports[0].error());
  EXPECT_NE(reports[0].error()->find("lookup exploded"), std::string::npos);
  EXPECT_TRUE(reports[1].ok());
}

TEST(IngestRunner, PassesExtractorToSync) {
  MemoryStore store;
  FakeWeb web;
  web.serve("https://a.example/rss",
            "<rss><channel><title>T</title><item><guid>a</guid></item></channel></rss>");
  IngestRunner(store, HttpOptions{}, 1, web.fn(), entry_extractor("(no title)"))
      .run({"https://a.example/rss"});
  std::vector<FeedItem> items = store.list_items(ItemFilter{});
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].title, "(no title)");
}

TEST(IngestRunner, EmptyBatch) {
  MemoryStore store;
  EXPECT_TRUE(IngestRunner(store, HttpOptions{}, 4).run({}).empty());
}

} // namespace
