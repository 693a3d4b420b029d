#include <unpack/plan_executor.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace unpack {

  namespace {

    bool
    has_column(const frame_engine& engine, const std::string& column) {
      auto columns = engine.columns();
      return std::find(columns.begin(), columns.end(), column) !=
             columns.end();
    }

    // Tracks the subtrees whose explode or unnest could not run. A column
    // found later under one of their paths belongs to the source, not to
    // the schema.
    class step_runner {
    public:
      step_runner(const unpack_plan& plan, frame_engine& engine,
                  const execute_options& opts)
          : plan_(plan), engine_(engine), opts_(opts) {}

      void
      run() {
        for (const auto& step : plan_.steps) {
          std::visit(
              [&](const auto& s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, explode_step>) {
                  if (ready(s.column, s.path, "explode"))
                    engine_.explode(s.column);
                } else if constexpr (std::is_same_v<T, unnest_step>) {
                  if (ready(s.column, s.path, "unnest"))
                    engine_.unnest(s.column);
                } else if constexpr (std::is_same_v<T, rename_step>) {
                  rename(s);
                }
              },
              step);
        }

        drop_shadowed();

        for (const auto& column : missing_columns(plan_, engine_.columns()))
          engine_.with_null_column(column.name, column.kind);

        engine_.select(plan_.columns);
      }

    private:
      const unpack_plan& plan_;
      frame_engine& engine_;
      const execute_options& opts_;
      std::vector<std::string> skipped_;

      bool
      in_skipped(const std::string& path) const {
        for (const auto& root : skipped_) {
          if (is_within(path, root, plan_.separator)) return true;
        }
        return false;
      }

      // False when the step has to be skipped.
      bool
      ready(const std::string& column, const std::string& path,
            const char* step) {
        if (in_skipped(path)) return false;
        if (has_column(engine_, column)) return true;

        std::string msg = std::string(step) + " of absent column '" + column +
                          "'";
        if (opts_.fail_fast) throw std::runtime_error("execute: " + msg);
        std::cerr << "unpack execute: warning: skipping " << msg << "\n";
        skipped_.push_back(path);
        return false;
      }

      void
      rename(const rename_step& s) {
        // Leaves of a missing subtree are simply not renamed
        std::vector<std::pair<std::string, std::string>> mapping;
        for (std::size_t i = 0; i < s.mapping.size(); ++i) {
          if (i < s.paths.size() && in_skipped(s.paths[i])) continue;
          if (has_column(engine_, s.mapping[i].first))
            mapping.push_back(s.mapping[i]);
        }
        if (!mapping.empty()) engine_.rename(mapping);
      }

      // Source columns named like a leaf of a skipped subtree.
      void
      drop_shadowed() {
        if (skipped_.empty()) return;

        std::vector<std::string> shadowed;
        for (const auto& d : plan_.defaults) {
          if (in_skipped(d.path) && has_column(engine_, d.name)) {
            std::cerr << "unpack execute: warning: dropping source column '"
                      << d.name << "' in place of absent '" << d.path
                      << "'\n";
            shadowed.push_back(d.name);
          }
        }
        if (!shadowed.empty()) engine_.drop(shadowed);
      }
    };

  } // namespace

  void
  execute(const unpack_plan& plan, frame_engine& engine,
          const execute_options& opts) {
    step_runner runner(plan, engine, opts);
    runner.run();
  }

} // namespace unpack
