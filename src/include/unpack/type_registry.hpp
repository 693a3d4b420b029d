#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace unpack {

  enum class scalar_kind {
    int8,
    int16,
    int32,
    int64,
    uint8,
    uint16,
    uint32,
    uint64,
    float32,
    float64,
    utf8,
  };

  enum class type_category { scalar, list, structure };

  struct type_entry {
    type_category category = type_category::scalar;
    scalar_kind kind = scalar_kind::utf8;

    bool
    is_container() const {
      return category != type_category::scalar;
    }
  };

  // Canonical display name, as written in schemas: Int8, UInt64, Utf8...
  std::string_view
  to_string(scalar_kind kind);

  class type_registry {
    std::unordered_map<std::string, type_entry> entries_;

  public:
    type_registry() = default;

    static const type_registry&
    defaults();

    // Case-insensitive lookup; nullptr for unknown names.
    const type_entry*
    find(std::string_view name) const;

    void
    set(std::string_view name, type_entry entry);

    std::size_t
    size() const;

    bool
    contains(std::string_view name) const;
  };

} // namespace unpack
