#include "entry_extract.h"
#include "date_parse.h"
#include <absl/strings/ascii.h>

static constexpr const char* kGuidFields[] = {"id", "link"};
static constexpr const char* kTextFields[] = {"summary", "description"};
static constexpr const char* kDateFields[] = {"published", "updated", "created"};

// First non-blank field among `names`, trimmed.
template <size_t N>
static std::optional<std::string> first_field(const RawEntry& e, const char* const (&names)[N]) {
  for (const char* name : names) {
    const std::string* v = e.field(name);
    if (!v) continue;
    absl::string_view trimmed = absl::StripAsciiWhitespace(*v);
    if (!trimmed.empty()) return std::string(trimmed);
  }
  return std::nullopt;
}

static std::optional<int64_t> published_of(const RawEntry& e) {
  for (const char* name : kDateFields) {
    auto it = e.parsed_dates.find(name);
    if (it != e.parsed_dates.end()) return it->second;
  }
  for (const char* name : kDateFields) {
    const std::string* v = e.field(name);
    if (!v) continue;
    if (auto ms = parse_date_lenient(*v)) return ms;
  }
  return std::nullopt;
}

static ExtractedItem extract_with(const RawEntry& entry, const std::string& placeholder_title) {
  ExtractedItem out;
  out.guid = first_field(entry, kGuidFields);

  const std::string* title = entry.field("title");
  absl::string_view t = title ? absl::StripAsciiWhitespace(*title) : absl::string_view();
  out.title = t.empty() ? placeholder_title : std::string(t);

  if (!entry.content.empty()) {
    out.content = entry.content.front().value;
  } else if (auto text = first_field(entry, kTextFields)) {
    out.content = std::move(*text);
  }

  out.published_ms = published_of(entry);
  if (const std::string* link = entry.field("link")) out.link = *link;
  if (const std::string* author = entry.field("author")) out.author = *author;
  return out;
}

ExtractedItem extract_entry(const RawEntry& entry) {
  return extract_with(entry, kUntitled);
}

ExtractFn entry_extractor(std::string placeholder_title) {
  return [placeholder_title = std::move(placeholder_title)](const RawEntry& entry) {
    return extract_with(entry, placeholder_title);
  };
}
