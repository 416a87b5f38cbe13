#pragma once
#include "record_stager/parser_settings.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

class RecordView;
class RecordStager;

// Line-fed CSV tokenizer. Characters are pushed into a RecordStager, which
// decides what is kept; every finished record is finalized and, if emitted,
// handed to the callback.
class CsvFsm {
public:
  using RecordCallback = std::function<void(const RecordView&)>;

  explicit CsvFsm(const ParserSettings& settings);
  ~CsvFsm();
  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // One physical line without its terminator. Returns false on error.
  bool feed(std::string_view line, const RecordCallback& on_record);
  // Flush end of input; fails when a quoted value is still open.
  bool finish(const RecordCallback& on_record);

  const std::optional<std::vector<std::string>>& headers() const;
  const RecordStager& stager() const;
  const std::string& error() const { return err_; }

  std::uint64_t rows() const;                     // emitted records
  std::uint64_t lines() const noexcept { return lines_; }
  std::uint64_t header_rows() const noexcept { return header_rows_; }
  std::uint64_t skipped_lines() const noexcept { return skipped_; }
  bool done() const noexcept { return done_; }    // record_limit reached

private:
  struct Impl; Impl* p_;
  std::uint64_t lines_{0};
  std::uint64_t header_rows_{0};
  std::uint64_t skipped_{0};
  bool done_{false};
  std::string err_;
};

}
