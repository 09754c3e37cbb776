#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "http_fetch.h"

enum class ParseStatus {
  kClean,      // well-formed RSS/Atom
  kTolerated,  // libxml2 recovered from errors; results may be partial
  kFailed,     // nothing usable: transport error, not XML, not a feed
};

struct ContentBlock {
  std::string type;   // "html", "text", "xhtml", "text/html", ...
  std::string value;
};

// One feed entry, flattened to canonical field names regardless of the
// source format. Keys used in `fields`: id, link, title, summary,
// description, published, updated, created, author.
struct RawEntry {
  std::map<std::string, std::string> fields;
  std::vector<ContentBlock> content;
  // Date fields from `fields` that parsed as RFC 822 / RFC 3339, epoch ms.
  std::map<std::string, int64_t> parsed_dates;

  const std::string* field(const std::string& name) const;
};

struct ParseResult {
  ParseStatus status = ParseStatus::kFailed;
  std::optional<std::string> title;
  std::vector<RawEntry> entries;            // document order
  std::optional<std::string> error;         // diagnostic for kTolerated/kFailed
  std::optional<TransportError> transport;  // set when the fetch failed
  std::string effective_url;

  bool malformed() const { return status != ParseStatus::kClean; }
  bool usable() const {
    return status != ParseStatus::kFailed && (title.has_value() || !entries.empty());
  }
};

// Parses an already-fetched document. Never throws.
ParseResult parse_feed_bytes(const std::string& bytes);

// Fetches url with opt through `fetch`, then parses the body.
ParseResult parse_feed_url(const std::string& url, const HttpOptions& opt,
                           const FetchFn& fetch = http_get);
