#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

// Lightweight view over an emitted record.
// fields_ are the values in output order (selected/reordered when configured);
// header_ optionally points to the resolved headers.
class RecordView {
public:
  RecordView() = default;
  RecordView(const std::vector<std::string>* header,
             const std::vector<std::string>* fields,
             const std::vector<int>* selected = nullptr)
      : header_(header), fields_(fields), selected_(selected) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? std::string_view((*fields_)[i]) : std::string_view{};
  }

  // Column name for output position i. When reordering, output position i
  // comes from input column selected[i].
  std::string_view colname(std::size_t i) const {
    if (!header_) return {};
    std::size_t col = i;
    if (selected_) {
      if (i >= selected_->size() || (*selected_)[i] < 0) return {};
      col = static_cast<std::size_t>((*selected_)[i]);
    }
    return col < header_->size() ? std::string_view((*header_)[col]) : std::string_view{};
  }

  const std::vector<std::string>* fields() const noexcept { return fields_; }

private:
  const std::vector<std::string>* header_{nullptr};
  const std::vector<std::string>* fields_{nullptr};
  const std::vector<int>* selected_{nullptr};
};

}
