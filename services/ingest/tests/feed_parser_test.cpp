#include <gtest/gtest.h>

#include "fake_web.h"
#include "feed_parser.h"

namespace {

const char kRss2[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0"
     xmlns:content="http://purl.org/rss/1.0/modules/content/"
     xmlns:dc="http://purl.org/dc/elements/1.1/">
  <channel>
    <title> Example News </title>
    <link>https://example.com/</link>
    <item>
      <title>First</title>
      <link>https://example.com/1</link>
      <guid isPermaLink="false">urn:example:1</guid>
      <description>Short &amp; sweet</description>
      <content:encoded><![CDATA[<p>Full <b>body</b></p>]]></content:encoded>
      <pubDate>Mon, 02 Jan 2006 15:04:05 GMT</pubDate>
      <dc:creator>Ann</dc:creator>
    </item>
    <item>
      <title>Second</title>
      <link>https://example.com/2</link>
      <pubDate>sometime last week</pubDate>
      <dc:date>2006-01-02T15:04:05Z</dc:date>
    </item>
  </channel>
</rss>)";

const char kAtom[] = R"(<?xml version="1.0" encoding="utf-8"?>
<feed xmlns="http://www.w3.org/2005/Atom">
  <title type="text">Atom Example</title>
  <entry>
    <title>Atom One</title>
    <id>tag:example.com,2006:1</id>
    <link rel="edit" href="https://example.com/edit/1"/>
    <link rel="alternate" type="text/html" href="https://example.com/a/1"/>
    <published>2006-01-02T15:04:05Z</published>
    <updated>2006-01-03T00:00:00Z</updated>
    <summary>Atom summary</summary>
    <content type="xhtml"><div xmlns="http://www.w3.org/1999/xhtml"><p>Rich</p></div></content>
    <author><name>Bob</name></author>
  </entry>
  <entry>
    <title>Atom Two</title>
    <link href="https://example.com/a/2"/>
    <content type="html">&lt;p&gt;Escaped&lt;/p&gt;</content>
  </entry>
</feed>)";

const char kRdf[] = R"(<?xml version="1.0"?>
<rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#"
         xmlns="http://purl.org/rss/1.0/"
         xmlns:dc="http://purl.org/dc/elements/1.1/">
  <channel rdf:about="https://example.com/">
    <title>RDF Example</title>
  </channel>
  <item rdf:about="https://example.com/r/1">
    <title>RDF One</title>
    <link>https://example.com/r/1</link>
    <description>RDF description</description>
    <dc:date>2006-01-02T15:04:05Z</dc:date>
  </item>
</rdf:RDF>)";

TEST(FeedParser, Rss2Fields) {
  ParseResult r = parse_feed_bytes(kRss2);
  ASSERT_EQ(r.status, ParseStatus::kClean);
  EXPECT_FALSE(r.malformed());
  EXPECT_TRUE(r.usable());
  EXPECT_EQ(r.title, "Example News");
  ASSERT_EQ(r.entries.size(), 2u);

  const RawEntry& e = r.entries[0];
  EXPECT_EQ(*e.field("id"), "urn:example:1");
  EXPECT_EQ(*e.field("link"), "https://example.com/1");
  EXPECT_EQ(*e.field("title"), "First");
  EXPECT_EQ(*e.field("description"), "Short & sweet");
  EXPECT_EQ(*e.field("author"), "Ann");
  ASSERT_EQ(e.content.size(), 1u);
  EXPECT_EQ(e.content[0].value, "<p>Full <b>body</b></p>");
  EXPECT_EQ(e.parsed_dates.at("published"), 1136214245000);
  EXPECT_EQ(e.field("summary"), nullptr);
}

TEST(FeedParser, UnparseablePubDateIsKeptAsStringOnly) {
  ParseResult r = parse_feed_bytes(kRss2);
  ASSERT_EQ(r.entries.size(), 2u);
  const RawEntry& e = r.entries[1];
  EXPECT_EQ(e.field("id"), nullptr);
  EXPECT_EQ(*e.field("published"), "sometime last week");
  EXPECT_EQ(e.parsed_dates.count("published"), 0u);
  EXPECT_EQ(e.parsed_dates.at("updated"), 1136214245000);
}

TEST(FeedParser, AtomFields) {
  ParseResult r = parse_feed_bytes(kAtom);
  ASSERT_EQ(r.status, ParseStatus::kClean);
  EXPECT_EQ(r.title, "Atom Example");
  ASSERT_EQ(r.entries.size(), 2u);

  const RawEntry& e = r.entries[0];
  EXPECT_EQ(*e.field("id"), "tag:example.com,2006:1");
  EXPECT_EQ(*e.field("link"), "https://example.com/a/1");
  EXPECT_EQ(*e.field("summary"), "Atom summary");
  EXPECT_EQ(*e.field("author"), "Bob");
  ASSERT_EQ(e.content.size(), 1u);
  EXPECT_EQ(e.content[0].type, "xhtml");
  EXPECT_NE(e.content[0].value.find("<p>Rich</p>"), std::string::npos);
  EXPECT_EQ(e.parsed_dates.at("published"), 1136214245000);

  const RawEntry& e2 = r.entries[1];
  EXPECT_EQ(e2.field("id"), nullptr);
  EXPECT_EQ(*e2.field("link"), "https://example.com/a/2");
  ASSERT_EQ(e2.content.size(), 1u);
  EXPECT_EQ(e2.content[0].type, "html");
  EXPECT_EQ(e2.content[0].value, "<p>Escaped</p>");
}

TEST(FeedParser, Rss1Rdf) {
  ParseResult r = parse_feed_bytes(kRdf);
  ASSERT_EQ(r.status, ParseStatus::kClean);
  EXPECT_EQ(r.title, "RDF Example");
  ASSERT_EQ(r.entries.size(), 1u);
  EXPECT_EQ(*r.entries[0].field("id"), "https://example.com/r/1");
  EXPECT_EQ(*r.entries[0].field("description"), "RDF description");
  EXPECT_EQ(r.entries[0].parsed_dates.at("updated"), 1136214245000);
}

TEST(FeedParser, KeepsDocumentOrder) {
  std::string xml = "<rss><channel><title>t</title>";
  for (const char* id : {"c", "a", "b"}) {
    xml += std::string("<item><guid>") + id + "</guid></item>";
  }
  xml += "</channel></rss>";
  ParseResult r = parse_feed_bytes(xml);
  ASSERT_EQ(r.entries.size(), 3u);
  EXPECT_EQ(*r.entries[0].field("id"), "c");
  EXPECT_EQ(*r.entries[1].field("id"), "a");
  EXPECT_EQ(*r.entries[2].field("id"), "b");
}

TEST(FeedParser, BrokenXmlWithEntriesIsTolerated) {
  // Bare ampersand and a missing closing tag.
  const char xml[] =
      "<rss><channel><title>Tom & Jerry</title>"
      "<item><guid>a</guid><title>One</title></item>"
      "<item><guid>b</guid><title>Two</title>";
  ParseResult r = parse_feed_bytes(xml);
  EXPECT_EQ(r.status, ParseStatus::kTolerated);
  EXPECT_TRUE(r.malformed());
  EXPECT_TRUE(r.usable());
  ASSERT_TRUE(r.error.has_value());
  EXPECT_FALSE(r.error->empty());
  ASSERT_GE(r.entries.size(), 1u);
  EXPECT_EQ(*r.entries[0].field("id"), "a");
}

TEST(FeedParser, EmptyChannelIsCleanButNotUsable) {
  ParseResult r = parse_feed_bytes("<rss version=\"2.0\"><channel></channel></rss>");
  EXPECT_EQ(r.status, ParseStatus::kClean);
  EXPECT_FALSE(r.title.has_value());
  EXPECT_TRUE(r.entries.empty());
  EXPECT_FALSE(r.usable());
}

TEST(FeedParser, HtmlPageFails) {
  ParseResult r = parse_feed_bytes("<html><head><title>Home</title></head><body/></html>");
  EXPECT_EQ(r.status, ParseStatus::kFailed);
  EXPECT_FALSE(r.usable());
  ASSERT_TRUE(r.error.has_value());
  EXPECT_NE(r.error->find("<html>"), std::string::npos);
}

TEST(FeedParser, NonXmlAndEmptyFail) {
  EXPECT_EQ(parse_feed_bytes("this is plain text").status, ParseStatus::kFailed);
  ParseResult empty = parse_feed_bytes("   \n");
  EXPECT_EQ(empty.status, ParseStatus::kFailed);
  EXPECT_EQ(empty.error, "empty document");
}

TEST(FeedParser, UrlFormUsesFetchAndReportsTransportErrors) {
  FakeWeb web;
  web.serve("https://example.com/rss", kRss2);
  web.fail("https://example.com/gone", TransportErrorKind::kHttpStatus, 404);
  HttpOptions opt;

  ParseResult ok = parse_feed_url("https://example.com/rss", opt, web.fn());
  EXPECT_EQ(ok.status, ParseStatus::kClean);
  EXPECT_EQ(ok.entries.size(), 2u);
  EXPECT_EQ(ok.effective_url, "https://example.com/rss");

  ParseResult gone = parse_feed_url("https://example.com/gone", opt, web.fn());
  EXPECT_EQ(gone.status, ParseStatus::kFailed);
  ASSERT_TRUE(gone.transport.has_value());
  EXPECT_EQ(gone.transport->kind, TransportErrorKind::kHttpStatus);
  EXPECT_EQ(gone.error->rfind("http-error(404)", 0), 0u);
}

} // namespace
