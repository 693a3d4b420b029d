#include <unpack/unpack_plan.hpp>

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace unpack {

  namespace {

    class plan_builder {
    public:
      plan_builder(const compiled_schema& schema, rename_strategy strategy)
          : schema_(schema), strategy_(strategy) {}

      unpack_plan
      build() {
        const auto& root = schema_.fields();
        for (const auto& f : root.fields)
          live_.insert(f.name);

        walk_fields(root, "");
        rename_leaves();

        for (const auto& b : schema_.bindings)
          plan_.defaults.push_back({b.renamed_to, b.kind, b.json_path});
        plan_.columns = schema_.columns;
        plan_.separator = schema_.separator;

        return std::move(plan_);
      }

    private:
      const compiled_schema& schema_;
      rename_strategy strategy_;
      unpack_plan plan_;

      // Column names present in the frame at the current step
      std::unordered_set<std::string> live_;
      // json path -> column currently holding that leaf
      std::unordered_map<std::string, std::string> leaf_columns_;

      std::string
      join(const std::string& path, const std::string& name) const {
        if (path.empty()) return name;
        if (name.empty()) return path;
        return path + schema_.separator + name;
      }

      [[noreturn]] void
      collision(const std::string& column, const std::string& step) const {
        std::string msg = "unpack_planner: " + step + " yields column '" +
                          column + "' which is already in use";
        if (strategy_ == rename_strategy::deferred_leaf)
          msg += " (eager_full_path renaming avoids this)";
        throw std::runtime_error(msg);
      }

      void
      rename(std::vector<std::pair<std::string, std::string>> mapping,
             std::vector<std::string> paths, const std::string& step) {
        if (mapping.empty()) return;

        std::unordered_set<std::string> sources;
        for (const auto& [from, to] : mapping)
          sources.insert(from);
        for (const auto& [from, to] : mapping) {
          if (live_.count(to) != 0 && sources.count(to) == 0)
            collision(to, step);
        }

        for (const auto& [from, to] : mapping)
          live_.erase(from);
        for (const auto& [from, to] : mapping)
          live_.insert(to);

        plan_.steps.push_back(rename_step{std::move(mapping), std::move(paths)});
      }

      void
      explode(const std::string& column, const std::string& path) {
        plan_.steps.push_back(explode_step{column, path});
      }

      void
      unnest(const std::string& column, const std::string& path,
             const struct_type& type) {
        live_.erase(column);
        for (const auto& f : type.fields) {
          if (live_.count(f.name) != 0)
            collision(f.name, "unnesting '" + column + "'");
          live_.insert(f.name);
        }
        plan_.steps.push_back(unnest_step{column, path});
      }

      // Fields of a struct whose columns were just brought to the top level
      // under their attribute names.
      void
      walk_fields(const struct_type& type, const std::string& path) {
        std::vector<std::string> columns;
        columns.reserve(type.fields.size());

        if (strategy_ == rename_strategy::eager_full_path) {
          std::vector<std::pair<std::string, std::string>> mapping;
          std::vector<std::string> paths;
          for (const auto& f : type.fields) {
            auto full = join(path, f.name);
            if (full != f.name) {
              mapping.emplace_back(f.name, full);
              paths.push_back(full);
            }
            columns.push_back(std::move(full));
          }
          rename(std::move(mapping), std::move(paths),
                 "renaming the fields of '" + path + "'");
        } else {
          for (const auto& f : type.fields)
            columns.push_back(f.name);
        }

        for (std::size_t i = 0; i < type.fields.size(); ++i) {
          const auto& f = type.fields[i];
          walk_type(f.type, columns[i], join(path, f.name), !f.name.empty());
        }
      }

      void
      walk_type(const data_type& type, const std::string& column,
                const std::string& path, bool named) {
        if (type.holds<scalar_type>()) {
          if (named) leaf_columns_[path] = column;
        } else if (type.holds<list_type>()) {
          explode(column, path);
          // List elements live in the list's own column
          walk_type(*type.get<list_type>().element, column, path, named);
        } else {
          const auto& st = type.get<struct_type>();
          unnest(column, path, st);
          walk_fields(st, path);
        }
      }

      void
      rename_leaves() {
        std::vector<std::pair<std::string, std::string>> mapping;
        std::vector<std::string> paths;
        for (const auto& b : schema_.bindings) {
          auto it = leaf_columns_.find(b.json_path);
          if (it == leaf_columns_.end()) {
            throw std::runtime_error("unpack_planner: no column holds '" +
                                     b.json_path + "'");
          }
          if (it->second != b.renamed_to) {
            mapping.emplace_back(it->second, b.renamed_to);
            paths.push_back(b.json_path);
          }
        }
        rename(std::move(mapping), std::move(paths), "renaming the leaves");
      }
    };

  } // namespace

  unpack_planner::unpack_planner(planner_options options)
      : options_(options) {}

  unpack_plan
  unpack_planner::plan(const compiled_schema& schema) const {
    plan_builder builder(schema, options_.strategy);
    return builder.build();
  }

  bool
  is_within(const std::string& path, const std::string& root,
            const std::string& separator) {
    if (root.empty() || path == root) return true;
    return path.size() > root.size() + separator.size() &&
           path.compare(0, root.size(), root) == 0 &&
           path.compare(root.size(), separator.size(), separator) == 0;
  }

  std::vector<null_column>
  missing_columns(const unpack_plan& plan,
                  const std::vector<std::string>& present) {
    std::unordered_set<std::string> have(present.begin(), present.end());
    std::vector<null_column> result;
    for (const auto& d : plan.defaults) {
      if (have.count(d.name) == 0) result.push_back(d);
    }
    return result;
  }

} // namespace unpack
