#include "record_stager/record_stager.hpp"
#include "record_stager/errors.hpp"
#include <algorithm>
#include <utility>

namespace rs {

RecordStager::RecordStager(const ParserSettings& settings)
  : settings_(settings),
    appender_(settings.max_chars_per_column, settings.ignore_trailing_whitespace),
    staged_(settings.max_columns),
    targets_(settings.max_columns, ColumnTarget::Capture) {
  if (settings.max_columns == 0) throw CapacityError("max_columns must be > 0", 0);
  active_ = targets_[0];
}

ColumnTarget RecordStager::target(std::size_t column) const noexcept {
  return column < targets_.size() ? targets_[column] : ColumnTarget::Discard;
}

// --- column router ---------------------------------------------------------

void RecordStager::stage(std::string value) {
  if (phase_ != Phase::Collecting) {
    throw SequenceError("field appended after finalize_row without reset");
  }
  if (column_ >= staged_.size()) {
    throw CapacityError("record has more than max_columns=" + std::to_string(staged_.size()) +
                        " fields", column_);
  }
  staged_[column_] = std::move(value);
  ++column_;
  active_ = target(column_);
}

void RecordStager::append_value(std::string_view text) {
  if (active_ == ColumnTarget::Capture) stage(std::string(text));
  else stage(settings_.null_value);
}

void RecordStager::append_empty() {
  appender_.reset();
  stage(settings_.null_value);
}

void RecordStager::value_parsed() {
  if (active_ == ColumnTarget::Capture && appender_.size() > 0) {
    stage(appender_.get_and_reset());
  } else {
    appender_.reset();
    stage(settings_.null_value);
  }
}

void RecordStager::quoted_value_parsed() {
  if (active_ == ColumnTarget::Capture) {
    if (appender_.size() > 0) stage(appender_.get_and_reset_raw());
    else stage(settings_.empty_value);
  } else {
    appender_.reset();
    stage(settings_.null_value);
  }
}

void RecordStager::append_char(char c) {
  if (active_ != ColumnTarget::Capture) return;
  try {
    appender_.append(c);
  } catch (const CapacityError& e) {
    throw CapacityError(e.what(), column_);
  }
}

void RecordStager::append_chars(std::string_view s) {
  if (active_ != ColumnTarget::Capture) return;
  try {
    appender_.append(s);
  } catch (const CapacityError& e) {
    throw CapacityError(e.what(), column_);
  }
}

void RecordStager::reset() {
  column_ = 0;
  appender_.reset();
  active_ = targets_[0];
  phase_ = Phase::Collecting;
}

// --- selection / reorder resolver -----------------------------------------

void RecordStager::resolve(const std::vector<std::string>& row) {
  if (initialized_) return;

  // Ask the selector before touching any state so a SelectionError leaves
  // the stager unresolved.
  std::optional<std::vector<int>> selected;
  if (settings_.selector) selected = settings_.selector->field_indexes(row);

  initialized_ = true;
  reordered_ = false;
  selected_ = std::move(selected);
  if (!selected_) return;

  std::fill(targets_.begin(), targets_.end(), ColumnTarget::Discard);
  for (int idx : *selected_) {
    const auto col = static_cast<std::size_t>(idx);
    if (idx >= 0 && col < targets_.size()) targets_[col] = ColumnTarget::Capture;
  }

  reordered_ = settings_.column_reordering;
  // Data rows may be wider than the row the selection was derived from.
  if (!reordered_ && row.size() < targets_.size()) {
    std::fill(targets_.begin() + static_cast<std::ptrdiff_t>(row.size()), targets_.end(),
              ColumnTarget::Capture);
  }
}

void RecordStager::initialize_headers() {
  if (settings_.headers) {
    resolve(*settings_.headers);
    headers_ = *settings_.headers;
  } else if (column_ > 0) {
    std::vector<std::string> row(staged_.begin(),
                                 staged_.begin() + static_cast<std::ptrdiff_t>(column_));
    resolve(row);
    if (settings_.header_extraction) headers_ = std::move(row);
  }
  // No configured headers and nothing parsed: wait for a row with fields.
}

// --- row reifier -------------------------------------------------------------

RowOutcome RecordStager::finalize_row() {
  if (phase_ == Phase::Finalized) {
    throw SequenceError("finalize_row called twice without reset");
  }
  phase_ = Phase::Finalized;

  if (column_ > 0) {
    if (!initialized_) {
      initialize_headers();
      if (settings_.header_extraction) {
        for (std::size_t i = 0; i < column_; ++i) staged_[i].clear();
        return RowOutcome::suppressed();
      }
    }

    ++records_;
    if (reordered_) {
      std::vector<std::string> out;
      out.reserve(selected_->size());
      for (int idx : *selected_) {
        const auto col = static_cast<std::size_t>(idx);
        out.push_back(col < column_ ? staged_[col] : settings_.null_value);
      }
      return RowOutcome::emit(std::move(out));
    }
    return RowOutcome::emit(std::vector<std::string>(
        staged_.begin(), staged_.begin() + static_cast<std::ptrdiff_t>(column_)));
  }

  if (settings_.skip_empty_lines) return RowOutcome::skipped();

  if (!initialized_) initialize_headers();
  ++records_;
  if (reordered_) {
    return RowOutcome::emit(std::vector<std::string>(selected_->size(), settings_.null_value));
  }
  return RowOutcome::emit({});
}

}
