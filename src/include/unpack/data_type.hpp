#pragma once

#include <unpack/type_registry.hpp>

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace unpack {

  // Forward declarations
  class data_type;
  struct field;

  // ---------------------------------------------------------------------------
  // Type node kinds
  // ---------------------------------------------------------------------------

  struct scalar_type {
    scalar_kind kind = scalar_kind::utf8;
  };

  struct list_type {
    std::unique_ptr<data_type> element;
  };

  struct struct_type {
    std::vector<field> fields;
  };

  // ---------------------------------------------------------------------------
  // Data type
  // ---------------------------------------------------------------------------

  class data_type {
  public:
    using variant_type = std::variant<scalar_type, list_type, struct_type>;

    data_type(variant_type v) : data_(std::move(v)) {}

    data_type(scalar_type v) : data_(std::move(v)) {}

    data_type(list_type v) : data_(std::move(v)) {}

    data_type(struct_type v) : data_(std::move(v)) {}

    data_type(const data_type&) = delete;
    data_type&
    operator=(const data_type&) = delete;
    data_type(data_type&&) = default;
    data_type&
    operator=(data_type&&) = default;

    const variant_type&
    data() const {
      return data_;
    }

    variant_type&
    data() {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    template <typename T>
    T&
    get() {
      return std::get<T>(data_);
    }

    bool
    is_container() const {
      return !holds<scalar_type>();
    }

  private:
    variant_type data_;
  };

  struct field {
    std::string name;
    data_type type;
  };

  // Structural equality: same shape, same field names, same scalar kinds.
  bool
  operator==(const data_type& lhs, const data_type& rhs);

  bool
  operator==(const field& lhs, const field& rhs);

  // Deep copy; data_type itself is move-only.
  data_type
  clone(const data_type& type);

  // Follow list elements down to a scalar. Returns nullptr when the chain
  // ends on a struct.
  const scalar_type*
  innermost_scalar(const data_type& type);

  data_type
  make_list(data_type element);

} // namespace unpack
