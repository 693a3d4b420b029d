#include <unpack/compiled_schema.hpp>

namespace unpack {

  const binding*
  compiled_schema::find_binding(std::string_view json_path) const {
    for (const auto& b : bindings) {
      if (b.json_path == json_path) return &b;
    }
    return nullptr;
  }

  bool
  operator==(const compiled_schema& lhs, const compiled_schema& rhs) {
    return lhs.root == rhs.root && lhs.bindings == rhs.bindings &&
           lhs.columns == rhs.columns && lhs.dtypes == rhs.dtypes &&
           lhs.separator == rhs.separator;
  }

} // namespace unpack
