#include "record_stager/parser_settings.hpp"
#include "record_stager/errors.hpp"

#include <simdjson.h>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rs {

namespace {

bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

std::string error_text(simdjson::error_code ec) { return simdjson::error_message(ec); }

bool read_bool(simdjson::ondemand::value v, std::string_view key, bool& out, std::string* err) {
  bool b = false;
  if (auto ec = v.get_bool().get(b)) return fail(err, "'" + std::string(key) + "' must be a boolean: " + error_text(ec));
  out = b;
  return true;
}

bool read_size(simdjson::ondemand::value v, std::string_view key, std::uint64_t& out, std::string* err) {
  std::uint64_t n = 0;
  if (auto ec = v.get_uint64().get(n)) return fail(err, "'" + std::string(key) + "' must be a non-negative integer: " + error_text(ec));
  out = n;
  return true;
}

bool read_string(simdjson::ondemand::value v, std::string_view key, std::string& out, std::string* err) {
  std::string_view s;
  if (auto ec = v.get_string().get(s)) return fail(err, "'" + std::string(key) + "' must be a string: " + error_text(ec));
  out.assign(s.data(), s.size());
  return true;
}

bool read_char(simdjson::ondemand::value v, std::string_view key, char& out, std::string* err) {
  std::string s;
  if (!read_string(v, key, s, err)) return false;
  if (s.size() > 1) return fail(err, "'" + std::string(key) + "' must be a single character, got \"" + s + "\"");
  out = s.empty() ? '\0' : s[0];
  return true;
}

bool read_strings(simdjson::ondemand::value v, std::string_view key,
                  std::vector<std::string>& out, std::string* err) {
  simdjson::ondemand::array arr;
  if (auto ec = v.get_array().get(arr)) return fail(err, "'" + std::string(key) + "' must be an array of strings: " + error_text(ec));
  out.clear();
  for (auto item : arr) {
    std::string_view s;
    if (auto ec = item.get_string().get(s)) return fail(err, "'" + std::string(key) + "' must be an array of strings: " + error_text(ec));
    out.emplace_back(s.data(), s.size());
  }
  return true;
}

bool read_ints(simdjson::ondemand::value v, std::string_view key,
               std::vector<int>& out, std::string* err) {
  simdjson::ondemand::array arr;
  if (auto ec = v.get_array().get(arr)) return fail(err, "'" + std::string(key) + "' must be an array of integers: " + error_text(ec));
  out.clear();
  for (auto item : arr) {
    std::int64_t n = 0;
    if (auto ec = item.get_int64().get(n)) return fail(err, "'" + std::string(key) + "' must be an array of integers: " + error_text(ec));
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
      return fail(err, "'" + std::string(key) + "' value " + std::to_string(n) + " out of range");
    }
    out.push_back(static_cast<int>(n));
  }
  return true;
}

}

bool ParserSettings::validate(std::string* err_out) const {
  if (max_columns == 0) return fail(err_out, "max_columns must be > 0");
  if (max_columns > kMaxColumnsLimit) {
    return fail(err_out, "max_columns must be <= " + std::to_string(kMaxColumnsLimit));
  }
  if (max_chars_per_column == 0) return fail(err_out, "max_chars_per_column must be > 0");
  if (max_chars_per_column > kMaxCharsPerColumnLimit) {
    return fail(err_out, "max_chars_per_column must be <= " + std::to_string(kMaxCharsPerColumnLimit));
  }
  if (delimiter == quote) return fail(err_out, "delimiter and quote must differ");
  if (delimiter == '\n' || delimiter == '\r') return fail(err_out, "delimiter cannot be a line break");
  return true;
}

bool parse_settings_json(std::string_view json, ParserSettings& out, std::string* err_out) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);

  ParserSettings s = out; // applied to `out` only when the whole document is valid
  int selectors = 0;

  try {
    simdjson::ondemand::document doc = parser.iterate(padded);
    simdjson::ondemand::object obj;
    if (auto ec = doc.get_object().get(obj)) return fail(err_out, "settings must be a JSON object: " + error_text(ec));

    for (auto item : obj) {
      simdjson::ondemand::field field;
      if (auto ec = std::move(item).get(field)) return fail(err_out, "malformed settings JSON: " + error_text(ec));
      std::string_view key;
      if (auto ec = field.unescaped_key().get(key)) return fail(err_out, "bad key: " + error_text(ec));
      simdjson::ondemand::value v = field.value();
      std::uint64_t n = 0;
      bool ok = true;

      if (key == "max_columns") {
        ok = read_size(v, key, n, err_out); s.max_columns = static_cast<std::size_t>(n);
      } else if (key == "max_chars_per_column") {
        ok = read_size(v, key, n, err_out); s.max_chars_per_column = static_cast<std::size_t>(n);
      } else if (key == "record_limit") {
        ok = read_size(v, key, n, err_out); s.record_limit = n;
      } else if (key == "headers") {
        std::vector<std::string> h;
        ok = read_strings(v, key, h, err_out);
        s.headers = std::move(h);
      } else if (key == "select_fields" || key == "exclude_fields") {
        std::vector<std::string> names;
        ok = read_strings(v, key, names, err_out);
        s.selector = (key == "select_fields") ? select_fields(std::move(names))
                                              : exclude_fields(std::move(names));
        ++selectors;
      } else if (key == "select_indexes" || key == "exclude_indexes") {
        std::vector<int> idx;
        ok = read_ints(v, key, idx, err_out);
        if (ok) {
          s.selector = (key == "select_indexes") ? select_indexes(std::move(idx))
                                                 : exclude_indexes(std::move(idx));
        }
        ++selectors;
      } else if (key == "column_reordering") {
        ok = read_bool(v, key, s.column_reordering, err_out);
      } else if (key == "skip_empty_lines") {
        ok = read_bool(v, key, s.skip_empty_lines, err_out);
      } else if (key == "header_extraction") {
        ok = read_bool(v, key, s.header_extraction, err_out);
      } else if (key == "ignore_leading_whitespace") {
        ok = read_bool(v, key, s.ignore_leading_whitespace, err_out);
      } else if (key == "ignore_trailing_whitespace") {
        ok = read_bool(v, key, s.ignore_trailing_whitespace, err_out);
      } else if (key == "null_value") {
        ok = read_string(v, key, s.null_value, err_out);
      } else if (key == "empty_value") {
        ok = read_string(v, key, s.empty_value, err_out);
      } else if (key == "delimiter") {
        ok = read_char(v, key, s.delimiter, err_out);
      } else if (key == "quote") {
        ok = read_char(v, key, s.quote, err_out);
      } else if (key == "comment") {
        ok = read_char(v, key, s.comment, err_out);
      } else {
        return fail(err_out, "unknown settings key '" + std::string(key) + "'");
      }
      if (!ok) return false;
    }
  } catch (const simdjson::simdjson_error& e) {
    return fail(err_out, std::string("malformed settings JSON: ") + e.what());
  } catch (const SelectionError& e) {
    return fail(err_out, e.what());
  }

  if (selectors > 1) return fail(err_out, "at most one of select_fields, select_indexes, exclude_fields, exclude_indexes may be set");
  if (!s.validate(err_out)) return false;
  out = std::move(s);
  return true;
}

bool load_settings_json(const std::string& path, ParserSettings& out, std::string* err_out) {
  simdjson::padded_string text;
  if (auto ec = simdjson::padded_string::load(path).get(text)) {
    return fail(err_out, "cannot read settings file " + path + ": " + error_text(ec));
  }
  return parse_settings_json(std::string_view(text.data(), text.size()), out, err_out);
}

}
