#include "url_check.h"
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <curl/curl.h>

// Reads one part of a parsed handle; empty when the part is absent.
static std::string url_part(CURLU* h, CURLUPart what) {
  char* part = nullptr;
  if (curl_url_get(h, what, &part, 0) != CURLUE_OK || !part) return {};
  std::string s(part);
  curl_free(part);
  return s;
}

std::optional<std::string> check_feed_url(const std::string& url) {
  if (absl::StripAsciiWhitespace(url).empty()) return std::string("URL is empty");

  CURLU* h = curl_url();
  if (!h) return std::string("URL could not be checked (out of memory)");

  // Accept any scheme at this stage so the scheme check below can name it.
  CURLUcode rc = curl_url_set(h, CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
  if (rc != CURLUE_OK) {
    std::string reason = absl::StrCat("URL is not well-formed: ", curl_url_strerror(rc));
    curl_url_cleanup(h);
    return reason;
  }

  std::string scheme = absl::AsciiStrToLower(url_part(h, CURLUPART_SCHEME));
  std::string host = url_part(h, CURLUPART_HOST);
  curl_url_cleanup(h);

  if (scheme != "http" && scheme != "https") {
    return absl::StrCat("URL scheme '", scheme, "' is not allowed (expected http or https)");
  }
  if (host.empty()) return std::string("URL has no host");
  return std::nullopt;
}
