#pragma once
#include "record_stager/char_appender.hpp"
#include "record_stager/parser_settings.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

// Per-column routing decision for characters produced by the tokenizer.
enum class ColumnTarget : std::uint8_t { Capture, Discard };

// Result of finalizing one record.
struct RowOutcome {
  enum class Kind { Emit, Suppressed, Skipped };

  Kind kind = Kind::Skipped;
  std::vector<std::string> values; // only meaningful for Emit

  static RowOutcome emit(std::vector<std::string> v) { return {Kind::Emit, std::move(v)}; }
  static RowOutcome suppressed() { return {Kind::Suppressed, {}}; }
  static RowOutcome skipped() { return {Kind::Skipped, {}}; }
};

// Staging area for the fields of the record being parsed.
//
// Driver protocol, per record:
//   append_value / append_empty / value_parsed  (zero or more, column order)
//   finalize_row                                (exactly once)
//   reset                                       (before the next record)
//
// On the first usable row the stager derives headers, selected columns and
// reordering once, and routes non-selected columns to Discard so the
// tokenizer's characters for them are dropped at the source.
class RecordStager {
public:
  explicit RecordStager(const ParserSettings& settings);

  // --- column router
  void append_value(std::string_view text);
  void append_empty();
  // Stages whatever append_char/append_chars accumulated for this column.
  void value_parsed();
  // Like value_parsed, for a quoted value: no trimming, and an empty
  // quoted value stages empty_value instead of null_value.
  void quoted_value_parsed();
  void append_char(char c);
  void append_chars(std::string_view s);
  void reset();

  ColumnTarget current_target() const noexcept { return active_; }
  bool capturing() const noexcept { return active_ == ColumnTarget::Capture; }
  ColumnTarget target(std::size_t column) const noexcept;
  std::size_t current_column() const noexcept { return column_; }

  // --- selection / reorder resolver
  // One-shot: a no-op once selection_initialized() is true.
  void resolve(const std::vector<std::string>& representative_row);
  bool selection_initialized() const noexcept { return initialized_; }

  // --- row reifier
  RowOutcome finalize_row();

  // --- introspection
  const std::optional<std::vector<std::string>>& headers() const noexcept { return headers_; }
  const std::optional<std::vector<int>>& selected_indexes() const noexcept { return selected_; }
  bool is_reordering_enabled() const noexcept { return reordered_; }
  std::uint64_t record_count() const noexcept { return records_; }
  const CharAppender& appender() const noexcept { return appender_; }

private:
  enum class Phase { Collecting, Finalized };

  void stage(std::string value);
  void initialize_headers();

  const ParserSettings settings_;
  CharAppender appender_;

  std::vector<std::string> staged_;    // max_columns slots, reused
  std::vector<ColumnTarget> targets_;  // max_columns slots
  std::size_t column_{0};
  ColumnTarget active_{ColumnTarget::Capture};
  Phase phase_{Phase::Collecting};

  bool initialized_{false};
  bool reordered_{false};
  std::optional<std::vector<int>> selected_;
  std::optional<std::vector<std::string>> headers_;
  std::uint64_t records_{0};
};

}
