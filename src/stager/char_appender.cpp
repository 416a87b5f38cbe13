#include "record_stager/char_appender.hpp"
#include "record_stager/errors.hpp"
#include <cstring>

namespace rs {

CharAppender::CharAppender(std::size_t max_chars, bool trim_trailing)
  : buf_(max_chars), head_(0), high_water_(0), trim_trailing_(trim_trailing) {}

void CharAppender::overflow(std::size_t wanted) const {
  throw CapacityError("value exceeds max_chars_per_column=" + std::to_string(buf_.size()) +
                      " (needed " + std::to_string(wanted) + ")", 0);
}

void CharAppender::append(char c) {
  if (head_ >= buf_.size()) overflow(head_ + 1);
  buf_[head_++] = c;
  if (head_ > high_water_) high_water_ = head_;
}

void CharAppender::append(std::string_view s) {
  if (s.empty()) return;
  if (head_ + s.size() > buf_.size()) overflow(head_ + s.size());
  std::memcpy(buf_.data() + head_, s.data(), s.size());
  head_ += s.size();
  if (head_ > high_water_) high_water_ = head_;
}

std::string_view CharAppender::view() const noexcept {
  return std::string_view(buf_.data(), head_);
}

std::string CharAppender::get_and_reset() {
  std::size_t n = head_;
  if (trim_trailing_) {
    while (n > 0 && static_cast<unsigned char>(buf_[n - 1]) <= ' ') --n;
  }
  std::string out(buf_.data(), n);
  head_ = 0;
  return out;
}

std::string CharAppender::get_and_reset_raw() {
  std::string out(buf_.data(), head_);
  head_ = 0;
  return out;
}

}
