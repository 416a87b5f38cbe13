#include "record_stager/record_writer.hpp"
#include "record_stager/record_view.hpp"

namespace rs {

void RecordWriter::write_value(std::string_view v) {
  bool needs_quote = false;
  for (char c : v) {
    if (c == delimiter_ || c == quote_ || c == '\n' || c == '\r') { needs_quote = true; break; }
  }
  if (!needs_quote) { out_ << v; return; }
  out_ << quote_;
  for (char c : v) {
    if (c == quote_) out_ << quote_;
    out_ << c;
  }
  out_ << quote_;
}

void RecordWriter::write(const RecordView& rv) {
  for (std::size_t i = 0; i < rv.size(); ++i) {
    if (i) out_ << delimiter_;
    write_value(rv.at(i));
  }
  out_ << '\n';
}

}
