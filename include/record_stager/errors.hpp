#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace rs {

// Root of the failures raised by the staging core. Boundary layers
// (CsvFsm, settings loader) catch these and report them with position context.
class StagingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A record tried to stage more fields (or a field more characters) than configured.
class CapacityError : public StagingError {
public:
  CapacityError(const std::string& what, std::size_t column)
      : StagingError(what), column_(column) {}
  std::size_t column() const noexcept { return column_; }

private:
  std::size_t column_;
};

// append -> finalize -> reset protocol violated by the driver.
class SequenceError : public StagingError {
public:
  using StagingError::StagingError;
};

// A field selector could not be applied to the representative row.
class SelectionError : public StagingError {
public:
  using StagingError::StagingError;
};

}
