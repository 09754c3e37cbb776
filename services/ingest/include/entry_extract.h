#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "feed_parser.h"

inline constexpr const char kUntitled[] = "Untitled";

struct ExtractedItem {
  std::optional<std::string> guid;      // absent: entry cannot be deduplicated
  std::string title;
  std::string content;
  std::optional<int64_t> published_ms;  // absent: no usable date field
  std::string link;
  std::string author;
};

// Pure and non-throwing; always returns best-effort values.
//   guid:      id, link
//   title:     title, "Untitled" (see entry_extractor)
//   content:   content[0].value, summary, description, ""
//   published: parsed published/updated/created, then the same names
//              through parse_date_lenient
ExtractedItem extract_entry(const RawEntry& entry);

using ExtractFn = std::function<ExtractedItem(const RawEntry&)>;

// extract_entry with `placeholder_title` in place of "Untitled".
ExtractFn entry_extractor(std::string placeholder_title);
