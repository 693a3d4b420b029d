#include <unpack/schema_compiler.hpp>
#include <unpack/schema_printer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace unpack;

TEST_CASE("printer: lone types", "[schema_printer]") {
  CHECK(print_schema(data_type(scalar_type{scalar_kind::uint16})) == "UInt16");
  CHECK(print_schema(make_list(data_type(scalar_type{scalar_kind::int8}))) ==
        "List(\n"
        "    Int8\n"
        ")");
}

TEST_CASE("printer: compiled schema with renames", "[schema_printer]") {
  schema_compiler compiler;
  auto schema = compiler.compile(R"(
    column: Utf8
    nested: List(
        Struct(
            attr: UInt8
            attr2=renamed: UInt8
        )
    )
    missing_from_source: Float32
  )");

  CHECK(print_schema(schema) == "column: Utf8\n"
                                "nested: List(\n"
                                "    Struct(\n"
                                "        attr: UInt8\n"
                                "        attr2=renamed: UInt8\n"
                                "    )\n"
                                ")\n"
                                "missing_from_source: Float32");

  SECTION("the bare type drops the renames") {
    CHECK(print_schema(schema.root).find("attr2: UInt8") != std::string::npos);
  }
}

TEST_CASE("printer: shorthands print canonical names", "[schema_printer]") {
  schema_compiler compiler;
  auto schema = compiler.compile("a: int, b: string, c: real, d: array[float]");
  CHECK(print_schema(schema) == "a: Int64\n"
                                "b: Utf8\n"
                                "c: Float64\n"
                                "d: List(\n"
                                "    Float64\n"
                                ")");
}

TEST_CASE("printer: output compiles back to the same schema",
          "[schema_printer]") {
  schema_compiler compiler;
  auto original = compiler.compile(
      "headers: Struct{timestamp: Int64, source=origin: Utf8}, "
      "lines: List[Struct(product: Int16, quantity: Int8)], "
      "tags: List<Utf8>");
  auto reparsed = compiler.compile(print_schema(original));
  CHECK(reparsed == original);
}

TEST_CASE("printer: custom separator", "[schema_printer]") {
  schema_compiler compiler(compile_options{"/"});
  auto schema = compiler.compile("json: Struct(foo=bar: Int8)");
  CHECK(print_schema(schema) == "json: Struct(\n"
                                "    foo=bar: Int8\n"
                                ")");
}
