#include "record_stager/token_csv_fsm.hpp"
#include "record_stager/errors.hpp"
#include "record_stager/record_stager.hpp"
#include "record_stager/record_view.hpp"
#include <string>
#include <string_view>

namespace rs {

struct CsvFsm::Impl {
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape };

  ParserSettings cfg;
  RecordStager stager;
  Mode mode{Mode::FieldStart};
  std::uint64_t record_start_line{0};

  explicit Impl(const ParserSettings& s) : cfg(s), stager(s) {}

  bool is_blank(char c) const {
    return c != cfg.delimiter && static_cast<unsigned char>(c) <= ' ';
  }

  void end_field() {
    if (mode == Mode::QuoteEscape) stager.quoted_value_parsed();
    else stager.value_parsed();
    mode = Mode::FieldStart;
  }

  // Scans one physical line. Returns false while a quoted value is still open.
  // Throws StagingError on capacity/selection problems; returns an error text
  // through `malformed` for quoting errors.
  bool scan(std::string_view line, std::string* malformed) {
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      switch (mode) {
        case Mode::FieldStart:
          if (c == cfg.delimiter) {
            stager.append_empty();
          } else if (c == cfg.quote) {
            mode = Mode::Quoted;
          } else if (cfg.ignore_leading_whitespace && is_blank(c)) {
            // skip
          } else {
            stager.append_char(c);
            mode = Mode::Unquoted;
          }
          break;
        case Mode::Unquoted:
          if (c == cfg.delimiter) end_field();
          else stager.append_char(c);
          break;
        case Mode::Quoted:
          if (c == cfg.quote) mode = Mode::QuoteEscape;
          else stager.append_char(c);
          break;
        case Mode::QuoteEscape:
          if (c == cfg.quote) {
            stager.append_char(c);          // escaped quote
            mode = Mode::Quoted;
          } else if (c == cfg.delimiter) {
            end_field();
          } else if (!is_blank(c)) {
            *malformed = std::string("unexpected character '") + c + "' after closing quote";
            return true;
          }
          break;
      }
    }

    if (mode == Mode::Quoted) {
      stager.append_char('\n');             // value continues on the next line
      return false;
    }
    if (mode == Mode::FieldStart) {
      // A trailing delimiter leaves one empty field. A blank or
      // whitespace-only line stages nothing.
      if (stager.current_column() > 0) stager.append_empty();
    } else {
      end_field();
    }
    return true;
  }

  void abandon_record() {
    stager.reset();
    mode = Mode::FieldStart;
  }
};

CsvFsm::CsvFsm(const ParserSettings& settings)
  : p_(new Impl(settings)) {}

CsvFsm::~CsvFsm() { delete p_; }

const std::optional<std::vector<std::string>>& CsvFsm::headers() const { return p_->stager.headers(); }
const RecordStager& CsvFsm::stager() const { return p_->stager; }
std::uint64_t CsvFsm::rows() const { return p_->stager.record_count(); }

bool CsvFsm::feed(std::string_view line, const RecordCallback& on_record) {
  ++lines_;
  if (done_) return true;

  const bool continuing = (p_->mode == Impl::Mode::Quoted);
  if (!continuing) {
    if (p_->cfg.comment != '\0' && !line.empty() && line.front() == p_->cfg.comment) return true;
    p_->record_start_line = lines_;
  }

  std::string malformed;
  try {
    if (!p_->scan(line, &malformed)) return true;   // record spans into the next line
    if (!malformed.empty()) {
      err_ = "line " + std::to_string(lines_) + ", column " +
             std::to_string(p_->stager.current_column() + 1) + ": " + malformed;
      p_->abandon_record();
      return false;
    }

    RowOutcome out = p_->stager.finalize_row();
    switch (out.kind) {
      case RowOutcome::Kind::Emit: {
        const RecordStager& st = p_->stager;
        const std::vector<std::string>* hdr = st.headers() ? &*st.headers() : nullptr;
        const std::vector<int>* sel = st.is_reordering_enabled() ? &*st.selected_indexes() : nullptr;
        RecordView rv(hdr, &out.values, sel);
        on_record(rv);
        if (p_->cfg.record_limit != 0 && st.record_count() >= p_->cfg.record_limit) done_ = true;
        break;
      }
      case RowOutcome::Kind::Suppressed:
        ++header_rows_;
        break;
      case RowOutcome::Kind::Skipped:
        ++skipped_;
        break;
    }
    p_->stager.reset();
  } catch (const CapacityError& e) {
    err_ = "line " + std::to_string(lines_) + ", column " + std::to_string(e.column() + 1) +
           ": " + e.what();
    p_->abandon_record();
    return false;
  } catch (const StagingError& e) {
    err_ = "line " + std::to_string(p_->record_start_line) + ": " + e.what();
    p_->abandon_record();
    return false;
  }
  return true;
}

bool CsvFsm::finish(const RecordCallback&) {
  if (p_->mode == Impl::Mode::Quoted) {
    err_ = "line " + std::to_string(p_->record_start_line) +
           ": unterminated quoted value at end of input";
    p_->abandon_record();
    return false;
  }
  return true;
}

}
