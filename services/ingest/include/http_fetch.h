#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>

struct HttpResponse {
  long status = 0;
  std::map<std::string, std::string> headers; // lowercased names, last value wins
  std::string body;
  std::string effective_url;
};

struct HttpOptions {
  std::string user_agent = "RSS Feed Reader/1.0";
  long timeout_secs = 10;
  long connect_timeout_secs = 5;
  long max_redirects = 5;
  bool accept_gzip = true;
};

enum class TransportErrorKind {
  kTimeout,
  kConnection,
  kTooManyRedirects,
  kHttpStatus,
};

struct TransportError {
  TransportErrorKind kind = TransportErrorKind::kConnection;
  long status = 0;      // set for kHttpStatus
  std::string detail;   // curl message or status line
};

// Either a 2xx response or a classified transport error, never both.
struct FetchResult {
  std::optional<HttpResponse> response;
  std::optional<TransportError> error;

  bool ok() const { return response.has_value(); }
};

// "timeout", "connection-error", "too-many-redirects", "http-error(404)"
std::string transport_error_class(const TransportError& err);

// "timeout: Operation timed out after 10001 milliseconds"
std::string describe_transport_error(const TransportError& err);

using FetchFn = std::function<FetchResult(const std::string& url, const HttpOptions& opt)>;

// Calls curl_global_init once; safe to call from several threads.
void http_global_init();

// Blocking GET, bounded by opt.timeout_secs and opt.max_redirects.
FetchResult http_get(const std::string& url, const HttpOptions& opt);
