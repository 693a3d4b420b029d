#include <unpack/schema_compiler.hpp>

#include <unpack/diagnostics.hpp>
#include <unpack/schema_error.hpp>
#include <unpack/schema_matcher.hpp>
#include <unpack/type_registry.hpp>

#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace unpack {

  namespace {

    // -----------------------------------------------------------------------
    // Open nesting contexts
    // -----------------------------------------------------------------------

    enum class frame_kind { list, structure };

    struct frame {
      std::string name; // empty for list elements and anonymous fields
      std::string keyword;
      frame_kind kind = frame_kind::structure;
      bool opened = false;
      std::size_t offset = 0;

      std::vector<field> fields;          // structure
      std::unique_ptr<data_type> element; // list
    };

    // -----------------------------------------------------------------------
    // Tree builder
    // -----------------------------------------------------------------------

    // One instance per compile() call.
    class tree_builder {
    public:
      tree_builder(std::string_view source, const compile_options& options)
          : source_(source), options_(options), matcher_(source) {}

      compiled_schema
      build() {
        while (true) {
          auto tok = matcher_.next();

          if (!frames_.empty() && !frames_.back().opened &&
              tok.kind != token_kind::open_delimiter) {
            fail<schema_parsing_error>("expected an opening delimiter after '" +
                                           frames_.back().keyword + "'",
                                       tok.offset);
          }

          if (tok.kind == token_kind::eof) break;

          switch (tok.kind) {
            case token_kind::renamed_attribute:
              on_renamed_attribute(tok);
              break;
            case token_kind::attribute:
              on_attribute(tok);
              break;
            case token_kind::lone_type:
              on_lone_type(tok);
              break;
            case token_kind::open_delimiter:
              on_open(tok);
              break;
            case token_kind::close_delimiter:
              on_close(tok);
              break;
            case token_kind::unexpected:
            case token_kind::eof:
              fail<schema_parsing_error>("unexpected content", tok.offset);
          }
        }

        if (!frames_.empty()) {
          fail<schema_parsing_error>("unterminated '" + frames_.back().keyword +
                                         "'",
                                     frames_.back().offset);
        }

        result_.root = data_type(struct_type{std::move(root_)});
        result_.separator = options_.separator;
        return std::move(result_);
      }

    private:
      std::string_view source_;
      const compile_options& options_;
      const type_registry& registry_ = type_registry::defaults();
      schema_matcher matcher_;

      std::vector<frame> frames_;
      std::vector<field> root_;
      compiled_schema result_;
      std::unordered_set<std::string> columns_;
      std::unordered_set<std::string> paths_;

      template <typename Error>
      [[noreturn]] void
      fail(const std::string& reason, std::size_t offset) const {
        throw Error(reason, format_diagnostic(source_, offset),
                    line_number_at(source_, offset), frames_.size());
      }

      const type_entry&
      resolve(std::string_view type, std::size_t offset) const {
        const auto* entry = registry_.find(type);
        if (entry == nullptr) {
          fail<unknown_data_type_error>(
              "unknown data type '" + std::string(type) + "'", offset);
        }
        return *entry;
      }

      bool
      in_list() const {
        return !frames_.empty() && frames_.back().kind == frame_kind::list;
      }

      // Segments of the open contexts plus `name`; list elements add nothing.
      std::string
      json_path(std::string_view name) const {
        std::string path;
        auto append = [&](std::string_view segment) {
          if (segment.empty()) return;
          if (!path.empty()) path += options_.separator;
          path += segment;
        };
        for (const auto& f : frames_)
          append(f.name);
        append(name);
        return path;
      }

      void
      require_named_slot(std::size_t offset) const {
        if (in_list()) {
          fail<schema_parsing_error>("list elements cannot be named", offset);
        }
      }

      void
      register_binding(std::string path, std::string renamed_to,
                       scalar_kind kind, std::size_t path_offset,
                       std::size_t renamed_offset) {
        if (columns_.count(renamed_to) != 0) {
          fail<duplicate_column_error>("duplicate column '" + renamed_to + "'",
                                       renamed_offset);
        }
        if (paths_.count(path) != 0) {
          fail<duplicate_column_error>("duplicate json path '" + path + "'",
                                       path_offset);
        }
        columns_.insert(renamed_to);
        paths_.insert(path);

        result_.columns.push_back(renamed_to);
        result_.dtypes.push_back(kind);
        result_.bindings.push_back(
            {std::move(path), std::move(renamed_to), kind});
      }

      // Adds a finished type to the innermost open context, or the root.
      void
      attach(std::string name, data_type type, std::size_t offset) {
        if (frames_.empty()) {
          root_.push_back(field{std::move(name), std::move(type)});
          return;
        }

        auto& top = frames_.back();
        if (top.kind == frame_kind::list) {
          if (top.element) {
            fail<schema_parsing_error>("a list holds a single element type",
                                       offset);
          }
          top.element = std::make_unique<data_type>(std::move(type));
        } else {
          top.fields.push_back(field{std::move(name), std::move(type)});
        }
      }

      void
      push(std::string name, std::string_view keyword, const type_entry& entry,
           std::size_t offset) {
        if (in_list() && frames_.back().element) {
          fail<schema_parsing_error>("a list holds a single element type",
                                     offset);
        }

        frame f;
        f.name = std::move(name);
        f.keyword = std::string(keyword);
        f.kind = entry.category == type_category::list ? frame_kind::list
                                                       : frame_kind::structure;
        f.offset = offset;
        frames_.push_back(std::move(f));
      }

      void
      add_leaf(const token& tok, scalar_kind kind) {
        require_named_slot(tok.name_offset);
        register_binding(json_path(tok.name), std::string(tok.new_name), kind,
                         tok.name_offset, tok.new_name_offset);
        attach(std::string(tok.name), data_type(scalar_type{kind}),
               tok.offset);
      }

      // -------------------------------------------------------------------
      // Token handlers
      // -------------------------------------------------------------------

      void
      on_renamed_attribute(const token& tok) {
        const auto* entry = registry_.find(tok.type);
        if (entry != nullptr && entry->is_container()) {
          fail<path_renaming_error>("cannot rename '" + std::string(tok.name) +
                                        "': only scalar fields can be renamed",
                                    tok.new_name_offset);
        }
        add_leaf(tok, resolve(tok.type, tok.type_offset).kind);
      }

      void
      on_attribute(const token& tok) {
        const auto& entry = resolve(tok.type, tok.type_offset);
        if (!entry.is_container()) {
          add_leaf(tok, entry.kind);
          return;
        }
        require_named_slot(tok.name_offset);
        push(std::string(tok.name), tok.type, entry, tok.offset);
      }

      void
      on_lone_type(const token& tok) {
        const auto& entry = resolve(tok.type, tok.type_offset);
        if (entry.is_container()) {
          push("", tok.type, entry, tok.offset);
          return;
        }
        attach("", data_type(scalar_type{entry.kind}), tok.offset);
      }

      void
      on_open(const token& tok) {
        if (frames_.empty() || frames_.back().opened) {
          fail<schema_parsing_error>("unexpected opening delimiter",
                                     tok.offset);
        }
        frames_.back().opened = true;
      }

      void
      on_close(const token& tok) {
        if (frames_.empty()) {
          fail<schema_parsing_error>("unexpected closing delimiter",
                                     tok.offset);
        }
        if (frames_.back().kind == frame_kind::list &&
            !frames_.back().element) {
          fail<schema_parsing_error>("'" + frames_.back().keyword +
                                         "' is missing its element type",
                                     tok.offset);
        }

        auto f = std::move(frames_.back());
        frames_.pop_back();

        auto type = f.kind == frame_kind::list
                        ? make_list(std::move(*f.element))
                        : data_type(struct_type{std::move(f.fields)});

        // A named list of scalars ends up as one flat column once exploded
        if (!f.name.empty()) {
          if (const auto* scalar = innermost_scalar(type)) {
            register_binding(json_path(f.name), f.name, scalar->kind,
                             f.offset, f.offset);
          }
        }

        attach(std::move(f.name), std::move(type), tok.offset);
      }
    };

  } // namespace

  schema_compiler::schema_compiler(compile_options options)
      : options_(std::move(options)) {}

  compiled_schema
  schema_compiler::compile(std::string_view source) const {
    tree_builder builder(source, options_);
    return builder.build();
  }

} // namespace unpack
