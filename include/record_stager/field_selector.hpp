#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rs {

// Decides which columns of a record are kept, given a representative row
// (configured headers or the first parsed row).
class FieldSelector {
public:
  virtual ~FieldSelector() = default;

  // Ordered column indexes to keep, or nullopt when selection does not
  // apply to this row. May throw SelectionError.
  virtual std::optional<std::vector<int>>
  field_indexes(const std::vector<std::string>& row) const = 0;

  // Short human-readable form, used in logs and errors.
  virtual std::string describe() const = 0;
};

using SelectorPtr = std::shared_ptr<const FieldSelector>;

// Keep the named columns, emitted in the given order.
SelectorPtr select_fields(std::vector<std::string> names);
// Keep the columns at the given positions, emitted in the given order.
SelectorPtr select_indexes(std::vector<int> indexes);
// Keep every column except the named ones.
SelectorPtr exclude_fields(std::vector<std::string> names);
// Keep every column except the given positions.
SelectorPtr exclude_indexes(std::vector<int> indexes);

}
