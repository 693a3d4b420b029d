#include <unpack/schema_printer.hpp>

#include <sstream>
#include <string>

namespace unpack {

  namespace {

    const std::string indent_unit = "    ";

    class printer {
    public:
      explicit printer(const compiled_schema* schema) : schema_(schema) {}

      std::string
      print(const data_type& type) {
        if (type.holds<struct_type>()) {
          for (const auto& f : type.get<struct_type>().fields)
            write_field(f, "", "");
        } else {
          write_type(type, "", "", "");
        }

        auto text = os_.str();
        if (!text.empty() && text.back() == '\n') text.pop_back();
        return text;
      }

    private:
      const compiled_schema* schema_;
      std::ostringstream os_;

      std::string
      join(const std::string& path, const std::string& name) const {
        if (path.empty()) return name;
        if (name.empty()) return path;
        return path + (schema_ ? schema_->separator : ".") + name;
      }

      std::string
      label(const field& f, const std::string& path) const {
        if (f.name.empty()) return "";
        std::string result = f.name;
        if (schema_ && f.type.holds<scalar_type>()) {
          const auto* b = schema_->find_binding(join(path, f.name));
          if (b && b->renamed_to != f.name) result += "=" + b->renamed_to;
        }
        return result + ": ";
      }

      void
      write_field(const field& f, const std::string& indent,
                  const std::string& path) {
        write_type(f.type, label(f, path), indent, join(path, f.name));
      }

      void
      write_type(const data_type& type, const std::string& prefix,
                 const std::string& indent, const std::string& path) {
        if (type.holds<scalar_type>()) {
          os_ << indent << prefix << to_string(type.get<scalar_type>().kind)
              << '\n';
        } else if (type.holds<list_type>()) {
          os_ << indent << prefix << "List(\n";
          const auto& element = type.get<list_type>().element;
          if (element) write_type(*element, "", indent + indent_unit, path);
          os_ << indent << ")\n";
        } else {
          os_ << indent << prefix << "Struct(\n";
          for (const auto& f : type.get<struct_type>().fields)
            write_field(f, indent + indent_unit, path);
          os_ << indent << ")\n";
        }
      }
    };

  } // namespace

  std::string
  print_schema(const data_type& type) {
    printer p(nullptr);
    return p.print(type);
  }

  std::string
  print_schema(const compiled_schema& schema) {
    printer p(&schema);
    return p.print(schema.root);
  }

} // namespace unpack
