#include "config.h"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

template <typename T>
static void read_opt(const YAML::Node& parent, const char* key, T& out) {
  if (parent && parent[key]) out = parent[key].as<T>();
}

IngestConfig load_ingest_config(const std::string& path) {
  IngestConfig c;
  try {
    YAML::Node root = YAML::LoadFile(path);

    auto h = root["http"];
    auto i = root["ingest"];

    // http
    read_opt(h, "user_agent", c.http.user_agent);
    read_opt(h, "timeout_secs", c.http.timeout_secs);
    read_opt(h, "connect_timeout_secs", c.http.connect_timeout_secs);
    read_opt(h, "max_redirects", c.http.max_redirects);
    read_opt(h, "accept_gzip", c.http.accept_gzip);

    // ingest
    read_opt(i, "max_concurrency", c.ingest.max_concurrency);
    read_opt(i, "placeholder_title", c.ingest.placeholder_title);

    // feeds: plain URLs or {url: ...} maps
    for (const auto& f : root["feeds"]) {
      if (f.IsScalar()) c.feeds.push_back(f.as<std::string>());
      else c.feeds.push_back(f["url"].as<std::string>());
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config " + path + ": " + e.what());
  }

  if (c.http.timeout_secs <= 0) throw std::runtime_error("config " + path + ": http.timeout_secs must be > 0");
  if (c.http.max_redirects < 0) throw std::runtime_error("config " + path + ": http.max_redirects must be >= 0");
  if (c.ingest.max_concurrency < 1) throw std::runtime_error("config " + path + ": ingest.max_concurrency must be >= 1");
  if (c.ingest.placeholder_title.empty()) throw std::runtime_error("config " + path + ": ingest.placeholder_title must not be empty");
  return c;
}
