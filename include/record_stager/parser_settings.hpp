#pragma once
#include "record_stager/field_selector.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

// Upper bounds accepted by ParserSettings::validate. The stager allocates
// both up front.
constexpr std::size_t kMaxColumnsLimit        = 1u << 16;
constexpr std::size_t kMaxCharsPerColumnLimit = 1u << 26;

// Session configuration. Read once when a RecordStager / CsvFsm is built and
// never changed afterwards.
struct ParserSettings {
  // Staging core
  std::size_t max_columns          = 512;
  std::size_t max_chars_per_column = 4096;
  std::optional<std::vector<std::string>> headers; // configured instead of extracted
  SelectorPtr selector;                            // none -> every column passes through
  bool column_reordering = true;
  bool skip_empty_lines  = true;
  bool header_extraction = false;
  std::string null_value;                          // unquoted empty / absent field
  std::string empty_value;                         // quoted empty field ""

  // Tokenizer
  char delimiter = ',';
  char quote     = '"';
  char comment   = '#';                            // '\0' disables comment lines
  bool ignore_leading_whitespace  = true;
  bool ignore_trailing_whitespace = true;
  std::uint64_t record_limit = 0;                  // 0 = unlimited

  bool validate(std::string* err_out = nullptr) const;
};

// Apply a JSON settings document over `out`. Keys not present keep their
// current value. Returns false and fills err_out on malformed input.
bool parse_settings_json(std::string_view json, ParserSettings& out,
                         std::string* err_out = nullptr);

bool load_settings_json(const std::string& path, ParserSettings& out,
                        std::string* err_out = nullptr);

}
