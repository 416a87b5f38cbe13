#pragma once
#include "record_stager/metrics.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rs {

struct RunJsonPayload {
  RunStats stats;

  // Resolved layout of the parse session
  std::optional<std::vector<std::string>> headers;
  std::optional<std::vector<int>> selected_indexes;
  bool reordered = false;

  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
  std::string error; // empty on success
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
  static bool write_file(const std::string& path, const RunJsonPayload& p,
                         std::string* err_out = nullptr);
};

}
