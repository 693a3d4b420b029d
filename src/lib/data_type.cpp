#include <unpack/data_type.hpp>

namespace unpack {

  bool
  operator==(const data_type& lhs, const data_type& rhs) {
    if (lhs.data().index() != rhs.data().index()) return false;

    if (lhs.holds<scalar_type>())
      return lhs.get<scalar_type>().kind == rhs.get<scalar_type>().kind;

    if (lhs.holds<list_type>()) {
      const auto& a = lhs.get<list_type>().element;
      const auto& b = rhs.get<list_type>().element;
      if (!a || !b) return !a && !b;
      return *a == *b;
    }

    return lhs.get<struct_type>().fields == rhs.get<struct_type>().fields;
  }

  bool
  operator==(const field& lhs, const field& rhs) {
    return lhs.name == rhs.name && lhs.type == rhs.type;
  }

  data_type
  clone(const data_type& type) {
    if (type.holds<scalar_type>()) return data_type(type.get<scalar_type>());

    if (type.holds<list_type>()) {
      const auto& element = type.get<list_type>().element;
      list_type copy;
      if (element) copy.element = std::make_unique<data_type>(clone(*element));
      return data_type(std::move(copy));
    }

    struct_type copy;
    for (const auto& f : type.get<struct_type>().fields)
      copy.fields.push_back(field{f.name, clone(f.type)});
    return data_type(std::move(copy));
  }

  const scalar_type*
  innermost_scalar(const data_type& type) {
    const data_type* current = &type;
    while (current->holds<list_type>()) {
      const auto& element = current->get<list_type>().element;
      if (!element) return nullptr;
      current = element.get();
    }
    if (current->holds<scalar_type>()) return &current->get<scalar_type>();
    return nullptr;
  }

  data_type
  make_list(data_type element) {
    return data_type(
        list_type{std::make_unique<data_type>(std::move(element))});
  }

} // namespace unpack
