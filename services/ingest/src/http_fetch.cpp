#include "http_fetch.h"
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/string_view.h>
#include <curl/curl.h>
#include <fmt/core.h>
#include <mutex>

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = reinterpret_cast<std::string*>(userdata);
  size_t total = size * nmemb;
  body->append(ptr, total);
  return total;
}

// Called once per header line, for every response in a redirect chain.
// A new status line starts a new header block, so only the final
// response's headers survive.
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* headers = reinterpret_cast<std::map<std::string, std::string>*>(userdata);
  size_t total = size * nitems;
  absl::string_view line(buffer, total);

  if (absl::StartsWith(line, "HTTP/")) {
    headers->clear();
    return total;
  }
  auto colon = line.find(':');
  if (colon == absl::string_view::npos) return total;

  std::string name = absl::AsciiStrToLower(absl::StripAsciiWhitespace(line.substr(0, colon)));
  absl::string_view value = absl::StripAsciiWhitespace(line.substr(colon + 1));
  if (!name.empty()) (*headers)[name] = std::string(value);
  return total;
}

static TransportErrorKind classify(CURLcode res) {
  switch (res) {
    case CURLE_OPERATION_TIMEDOUT:
      return TransportErrorKind::kTimeout;
    case CURLE_TOO_MANY_REDIRECTS:
      return TransportErrorKind::kTooManyRedirects;
    default:
      return TransportErrorKind::kConnection;
  }
}

std::string transport_error_class(const TransportError& err) {
  switch (err.kind) {
    case TransportErrorKind::kTimeout:
      return "timeout";
    case TransportErrorKind::kConnection:
      return "connection-error";
    case TransportErrorKind::kTooManyRedirects:
      return "too-many-redirects";
    case TransportErrorKind::kHttpStatus:
      return absl::StrFormat("http-error(%d)", err.status);
  }
  return "connection-error";
}

std::string describe_transport_error(const TransportError& err) {
  if (err.detail.empty()) return transport_error_class(err);
  return absl::StrCat(transport_error_class(err), ": ", err.detail);
}

void http_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

FetchResult http_get(const std::string& url, const HttpOptions& opt) {
  http_global_init();

  FetchResult out;
  CURL* curl = curl_easy_init();
  if (!curl) {
    out.error = TransportError{TransportErrorKind::kConnection, 0, "curl_easy_init failed"};
    return out;
  }

  HttpResponse resp;
  char errbuf[CURL_ERROR_SIZE]; errbuf[0] = 0;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, opt.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opt.max_redirects);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, opt.timeout_secs);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opt.connect_timeout_secs);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // worker threads
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  if (opt.accept_gzip) {
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  }

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = errbuf[0] ? errbuf : curl_easy_strerror(res);
    fmt::print(stderr, "[http] WARN curl error url={} code={}: {}\n", url, (int)res, msg);
    curl_easy_cleanup(curl);
    out.error = TransportError{classify(res), 0, std::move(msg)};
    return out;
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  char* eff = nullptr;
  curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff);
  resp.effective_url = eff ? std::string(eff) : url;
  curl_easy_cleanup(curl);

  if (resp.status < 200 || resp.status >= 300) {
    fmt::print(stderr, "[http] WARN non-2xx url={} status={}\n", url, resp.status);
    out.error = TransportError{TransportErrorKind::kHttpStatus, resp.status,
                               absl::StrCat("HTTP status ", resp.status)};
    return out;
  }

  out.response = std::move(resp);
  return out;
}
