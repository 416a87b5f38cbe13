#pragma once
#include <ostream>
#include <string_view>

namespace rs {

class RecordView;

// Writes records as delimited lines, quoting values that need it.
class RecordWriter {
public:
  RecordWriter(std::ostream& out, char delimiter = ',', char quote = '"')
      : out_(out), delimiter_(delimiter), quote_(quote) {}

  void write(const RecordView& rv);

private:
  void write_value(std::string_view v);

  std::ostream& out_;
  char delimiter_;
  char quote_;
};

}
