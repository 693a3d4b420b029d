#pragma once

#include <unpack/type_registry.hpp>

#include <string>
#include <utility>
#include <vector>

namespace unpack {

  // Tabular engine holding the frame a plan is applied to. Implementations
  // wrap whatever columnar library does the actual work.
  class frame_engine {
  public:
    virtual ~frame_engine() = default;

    virtual std::vector<std::string>
    columns() const = 0;

    virtual void
    explode(const std::string& column) = 0;

    virtual void
    unnest(const std::string& column) = 0;

    virtual void
    rename(const std::vector<std::pair<std::string, std::string>>& mapping) = 0;

    virtual void
    select(const std::vector<std::string>& columns) = 0;

    virtual void
    drop(const std::vector<std::string>& columns) = 0;

    virtual void
    with_null_column(const std::string& name, scalar_kind kind) = 0;
  };

} // namespace unpack
