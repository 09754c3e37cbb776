#pragma once
#include <string>
#include <vector>

#include "entry_extract.h"
#include "http_fetch.h"

struct IngestSettings {
  int max_concurrency = 4;
  std::string placeholder_title = kUntitled;  // for entries without a title
};

struct IngestConfig {
  HttpOptions http;
  IngestSettings ingest;
  std::vector<std::string> feeds;
};

// Throws std::runtime_error naming `path` on a missing file, bad YAML or
// a value of the wrong type. Absent keys keep their defaults.
IngestConfig load_ingest_config(const std::string& path);
