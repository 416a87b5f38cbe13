#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

// Fixed-capacity character accumulator for the value of the column being parsed.
// The buffer is allocated once and reused for every field of the session.
class CharAppender {
public:
  explicit CharAppender(std::size_t max_chars = 4096, bool trim_trailing = false);

  void append(char c);
  void append(std::string_view s);

  // Returns the accumulated value and rewinds the head.
  // Trailing whitespace is dropped when trimming is enabled.
  std::string get_and_reset();
  // Same, never trimming (quoted values keep their whitespace).
  std::string get_and_reset_raw();

  std::string_view view() const noexcept;
  void reset() noexcept { head_ = 0; }

  std::size_t size() const noexcept { return head_; }
  std::size_t capacity() const noexcept { return buf_.size(); }
  std::size_t high_water() const noexcept { return high_water_; }

private:
  [[noreturn]] void overflow(std::size_t wanted) const;

  std::vector<char> buf_;
  std::size_t head_{0};
  std::size_t high_water_{0};
  bool trim_trailing_{false};
};

}
