#include <unpack/type_registry.hpp>

#include <cctype>
#include <string>
#include <utility>

namespace unpack {

  namespace {

    std::string
    to_lower(std::string_view name) {
      std::string result;
      result.reserve(name.size());
      for (char c : name)
        result += static_cast<char>(
            std::tolower(static_cast<unsigned char>(c)));
      return result;
    }

    type_registry
    build_defaults() {
      type_registry registry;

      auto scalar = [&](std::string_view name, scalar_kind kind) {
        registry.set(name, {type_category::scalar, kind});
      };

      // Signed integers
      scalar("int8", scalar_kind::int8);
      scalar("int16", scalar_kind::int16);
      scalar("int32", scalar_kind::int32);
      scalar("int64", scalar_kind::int64);

      // Unsigned integers
      scalar("uint8", scalar_kind::uint8);
      scalar("uint16", scalar_kind::uint16);
      scalar("uint32", scalar_kind::uint32);
      scalar("uint64", scalar_kind::uint64);

      // Floating point
      scalar("float32", scalar_kind::float32);
      scalar("float64", scalar_kind::float64);

      scalar("utf8", scalar_kind::utf8);

      // Shorthands
      scalar("int", scalar_kind::int64);
      scalar("integer", scalar_kind::int64);
      scalar("float", scalar_kind::float64);
      scalar("real", scalar_kind::float64);
      scalar("string", scalar_kind::utf8);

      // Containers; "array" is kept as a synonym of "list"
      registry.set("list", {type_category::list, scalar_kind::utf8});
      registry.set("array", {type_category::list, scalar_kind::utf8});
      registry.set("struct", {type_category::structure, scalar_kind::utf8});

      return registry;
    }

  } // namespace

  std::string_view
  to_string(scalar_kind kind) {
    switch (kind) {
      case scalar_kind::int8:
        return "Int8";
      case scalar_kind::int16:
        return "Int16";
      case scalar_kind::int32:
        return "Int32";
      case scalar_kind::int64:
        return "Int64";
      case scalar_kind::uint8:
        return "UInt8";
      case scalar_kind::uint16:
        return "UInt16";
      case scalar_kind::uint32:
        return "UInt32";
      case scalar_kind::uint64:
        return "UInt64";
      case scalar_kind::float32:
        return "Float32";
      case scalar_kind::float64:
        return "Float64";
      case scalar_kind::utf8:
        return "Utf8";
    }
    return "Unknown";
  }

  const type_registry&
  type_registry::defaults() {
    static const type_registry registry = build_defaults();
    return registry;
  }

  const type_entry*
  type_registry::find(std::string_view name) const {
    auto it = entries_.find(to_lower(name));
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  void
  type_registry::set(std::string_view name, type_entry entry) {
    entries_.insert_or_assign(to_lower(name), entry);
  }

  std::size_t
  type_registry::size() const {
    return entries_.size();
  }

  bool
  type_registry::contains(std::string_view name) const {
    return entries_.count(to_lower(name)) != 0;
  }

} // namespace unpack
