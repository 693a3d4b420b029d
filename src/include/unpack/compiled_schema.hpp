#pragma once

#include <unpack/data_type.hpp>
#include <unpack/type_registry.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace unpack {

  // Full json path of a leaf and the flat column it ends up in.
  struct binding {
    std::string json_path;
    std::string renamed_to;
    scalar_kind kind = scalar_kind::utf8;

    bool
    operator==(const binding&) const = default;
  };

  struct compiled_schema {
    // Always a struct_type; lone types at the top level become anonymous
    // fields.
    data_type root = data_type(struct_type{});

    // In declaration order, which is also the output column order.
    std::vector<binding> bindings;
    std::vector<std::string> columns;
    std::vector<scalar_kind> dtypes;

    // Separator the json paths were joined with.
    std::string separator = ".";

    const struct_type&
    fields() const {
      return root.get<struct_type>();
    }

    const binding*
    find_binding(std::string_view json_path) const;
  };

  bool
  operator==(const compiled_schema& lhs, const compiled_schema& rhs);

} // namespace unpack
