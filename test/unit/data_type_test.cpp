#include <unpack/data_type.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace unpack;

namespace {

  data_type
  scalar(scalar_kind kind) {
    return data_type(scalar_type{kind});
  }

  data_type
  record(std::string a, scalar_kind ka, std::string b, scalar_kind kb) {
    struct_type st;
    st.fields.push_back(field{std::move(a), scalar(ka)});
    st.fields.push_back(field{std::move(b), scalar(kb)});
    return data_type(std::move(st));
  }

} // namespace

TEST_CASE("data_type: variant access", "[data_type]") {
  auto t = make_list(scalar(scalar_kind::int8));
  REQUIRE(t.holds<list_type>());
  CHECK(t.is_container());
  const auto& element = t.get<list_type>().element;
  REQUIRE(element);
  CHECK(element->holds<scalar_type>());
  CHECK(element->get<scalar_type>().kind == scalar_kind::int8);
  CHECK_FALSE(element->is_container());
}

TEST_CASE("data_type: structural equality", "[data_type]") {
  auto a = record("foo", scalar_kind::int8, "bar", scalar_kind::utf8);
  auto b = record("foo", scalar_kind::int8, "bar", scalar_kind::utf8);
  CHECK(a == b);

  SECTION("field order matters") {
    auto c = record("bar", scalar_kind::utf8, "foo", scalar_kind::int8);
    CHECK_FALSE(a == c);
  }

  SECTION("names matter") {
    auto c = record("foo", scalar_kind::int8, "baz", scalar_kind::utf8);
    CHECK_FALSE(a == c);
  }

  SECTION("kinds matter") {
    auto c = record("foo", scalar_kind::int16, "bar", scalar_kind::utf8);
    CHECK_FALSE(a == c);
  }

  SECTION("shape matters") {
    CHECK_FALSE(make_list(scalar(scalar_kind::int8)) ==
                scalar(scalar_kind::int8));
    CHECK_FALSE(make_list(scalar(scalar_kind::int8)) ==
                make_list(make_list(scalar(scalar_kind::int8))));
  }
}

TEST_CASE("data_type: clone is deep and equal", "[data_type]") {
  struct_type st;
  st.fields.push_back(field{"lines", make_list(record("product",
                                                     scalar_kind::int16,
                                                     "quantity",
                                                     scalar_kind::int8))});
  data_type original(std::move(st));

  auto copy = clone(original);
  CHECK(copy == original);

  copy.get<struct_type>().fields[0].name = "renamed";
  CHECK_FALSE(copy == original);
  CHECK(original.get<struct_type>().fields[0].name == "lines");
}

TEST_CASE("data_type: innermost scalar of nested lists", "[data_type]") {
  auto nested = make_list(make_list(scalar(scalar_kind::float32)));
  const auto* s = innermost_scalar(nested);
  REQUIRE(s != nullptr);
  CHECK(s->kind == scalar_kind::float32);

  auto direct = scalar(scalar_kind::utf8);
  REQUIRE(innermost_scalar(direct) != nullptr);
  CHECK(innermost_scalar(direct)->kind == scalar_kind::utf8);

  auto of_struct =
      make_list(record("a", scalar_kind::int8, "b", scalar_kind::int8));
  CHECK(innermost_scalar(of_struct) == nullptr);
}
