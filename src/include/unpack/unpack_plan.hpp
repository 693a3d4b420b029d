#pragma once

#include <unpack/compiled_schema.hpp>
#include <unpack/type_registry.hpp>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace unpack {

  // ---------------------------------------------------------------------------
  // Decomposition steps
  // ---------------------------------------------------------------------------

  // Each step also carries the json path of the subtree it works on. When
  // the executor skips a step, later steps under that path are skipped too.

  // One row per element of a list column; the other columns repeat.
  struct explode_step {
    std::string column;
    std::string path;

    bool
    operator==(const explode_step&) const = default;
  };

  // Replace a struct column by one column per field.
  struct unnest_step {
    std::string column;
    std::string path;

    bool
    operator==(const unnest_step&) const = default;
  };

  // Old name -> new name, applied together.
  struct rename_step {
    std::vector<std::pair<std::string, std::string>> mapping;
    std::vector<std::string> paths; // one per mapping entry

    bool
    operator==(const rename_step&) const = default;
  };

  using plan_step = std::variant<explode_step, unnest_step, rename_step>;

  // Column materialized as typed nulls when the source does not provide it.
  struct null_column {
    std::string name;
    scalar_kind kind = scalar_kind::utf8;
    std::string path;

    bool
    operator==(const null_column&) const = default;
  };

  struct unpack_plan {
    std::vector<plan_step> steps;
    std::vector<null_column> defaults;
    std::vector<std::string> columns; // final selection, in order
    std::string separator = ".";
  };

  // True when `path` is `root` or lies below it.
  bool
  is_within(const std::string& path, const std::string& root,
            const std::string& separator);

  // ---------------------------------------------------------------------------
  // Planner
  // ---------------------------------------------------------------------------

  enum class rename_strategy {
    // Every nested column is renamed to its full json path before it is
    // decomposed; intermediate names never clash. Root-level leaves keep
    // their names, so a nested attribute with the name of a root leaf still
    // collides when its parent is unnested.
    eager_full_path,
    // Columns keep their attribute names; leaves are renamed at the end.
    deferred_leaf,
  };

  struct planner_options {
    rename_strategy strategy = rename_strategy::eager_full_path;
  };

  class unpack_planner {
    planner_options options_;

  public:
    explicit unpack_planner(planner_options options = {});

    // Throws std::runtime_error when a step would produce a column name
    // that is already in use.
    unpack_plan
    plan(const compiled_schema& schema) const;
  };

  // Defaults of `plan` whose column is not in `present`.
  std::vector<null_column>
  missing_columns(const unpack_plan& plan,
                  const std::vector<std::string>& present);

} // namespace unpack
