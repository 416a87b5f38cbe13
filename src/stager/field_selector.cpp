#include "record_stager/field_selector.hpp"
#include "record_stager/errors.hpp"
#include <algorithm>
#include <string_view>
#include <utility>

namespace rs {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && static_cast<unsigned char>(s.front()) <= ' ') s.remove_prefix(1);
  while (!s.empty() && static_cast<unsigned char>(s.back()) <= ' ') s.remove_suffix(1);
  return s;
}

std::string join(const std::vector<std::string>& v) {
  std::string out;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += ", ";
    out += v[i];
  }
  return out;
}

std::string join(const std::vector<int>& v) {
  std::string out;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += ", ";
    out += std::to_string(v[i]);
  }
  return out;
}

// Position of `name` in `row`, comparing trimmed text. Throws when absent.
int index_of(const std::vector<std::string>& row, const std::string& name) {
  const std::string_view want = trim(name);
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (trim(row[i]) == want) return static_cast<int>(i);
  }
  throw SelectionError("could not find field '" + name + "' in headers [" + join(row) +
                       "]; enable header extraction or configure headers");
}

std::vector<int> checked(std::vector<int> indexes) {
  for (int i : indexes) {
    if (i < 0) throw SelectionError("field index must be >= 0, got " + std::to_string(i));
  }
  return indexes;
}

class NameSelector final : public FieldSelector {
public:
  explicit NameSelector(std::vector<std::string> names) : names_(std::move(names)) {}

  std::optional<std::vector<int>>
  field_indexes(const std::vector<std::string>& row) const override {
    if (row.empty()) return std::nullopt;
    std::vector<int> out;
    out.reserve(names_.size());
    for (const auto& n : names_) out.push_back(index_of(row, n));
    return out;
  }

  std::string describe() const override { return "select_fields[" + join(names_) + "]"; }

private:
  std::vector<std::string> names_;
};

class IndexSelector final : public FieldSelector {
public:
  explicit IndexSelector(std::vector<int> indexes) : indexes_(checked(std::move(indexes))) {}

  std::optional<std::vector<int>>
  field_indexes(const std::vector<std::string>&) const override {
    return indexes_;
  }

  std::string describe() const override { return "select_indexes[" + join(indexes_) + "]"; }

private:
  std::vector<int> indexes_;
};

class ExcludeNameSelector final : public FieldSelector {
public:
  explicit ExcludeNameSelector(std::vector<std::string> names) : names_(std::move(names)) {}

  std::optional<std::vector<int>>
  field_indexes(const std::vector<std::string>& row) const override {
    if (row.empty()) return std::nullopt;
    std::vector<bool> drop(row.size(), false);
    for (const auto& n : names_) drop[static_cast<std::size_t>(index_of(row, n))] = true;
    std::vector<int> out;
    for (std::size_t i = 0; i < row.size(); ++i) {
      if (!drop[i]) out.push_back(static_cast<int>(i));
    }
    return out;
  }

  std::string describe() const override { return "exclude_fields[" + join(names_) + "]"; }

private:
  std::vector<std::string> names_;
};

class ExcludeIndexSelector final : public FieldSelector {
public:
  explicit ExcludeIndexSelector(std::vector<int> indexes) : indexes_(checked(std::move(indexes))) {}

  std::optional<std::vector<int>>
  field_indexes(const std::vector<std::string>& row) const override {
    std::vector<int> out;
    for (std::size_t i = 0; i < row.size(); ++i) {
      const int idx = static_cast<int>(i);
      if (std::find(indexes_.begin(), indexes_.end(), idx) == indexes_.end()) out.push_back(idx);
    }
    return out;
  }

  std::string describe() const override { return "exclude_indexes[" + join(indexes_) + "]"; }

private:
  std::vector<int> indexes_;
};

}

SelectorPtr select_fields(std::vector<std::string> names) {
  return std::make_shared<NameSelector>(std::move(names));
}

SelectorPtr select_indexes(std::vector<int> indexes) {
  return std::make_shared<IndexSelector>(std::move(indexes));
}

SelectorPtr exclude_fields(std::vector<std::string> names) {
  return std::make_shared<ExcludeNameSelector>(std::move(names));
}

SelectorPtr exclude_indexes(std::vector<int> indexes) {
  return std::make_shared<ExcludeIndexSelector>(std::move(indexes));
}

}
