#include <cassert>
#include <iostream>
#include <string>
#include "schemac/compiler/boolean.hpp"
#include "schemac/compiler/common.hpp"
#include "schemac/compiler/predicates.hpp"
#include "schemac/schema.hpp"

using namespace schemac;

static std::string violation(const Json& schema_json, const Json& value) {
  Schema schema(schema_json);
  try {
    schema.validate(value);
  } catch (const ValidationError& e) {
    return e.keyword();
  }
  return "";
}

// ============================================================================
// Predicates
// ============================================================================

void test_predicates() {
  std::cout << "test_predicates...\n";
  using namespace schemac::predicates;
  assert(is_integer(Json(3)));
  assert(is_integer(Json(3.0)));
  assert(!is_integer(Json(3.5)));
  assert(!is_integer(Json("3")));
  assert(is_number(Json(3.5)));
  assert(!is_number(Json(true)));
  assert(is_schema(Json::object()));
  assert(is_schema(Json(false)));
  assert(!is_schema(Json::array()));
  assert(is_typed_array(Json::array(), is_string));
  assert(!is_enum(Json::array(), is_string));
  assert(is_enum(Json::array({"a", "b"}), is_string));
  assert(!is_enum(Json::array({"a", 1}), is_string));
  assert(numeric_predicate(nullptr) == &is_number);
  Json integer = "integer";
  assert(numeric_predicate(&integer) == &is_integer);
  std::cout << "  [PASS]\n";
}

// ============================================================================
// Boolean compiler
// ============================================================================

void test_boolean_type() {
  std::cout << "test_boolean_type...\n";
  assert(compiler::boolean::compile(Json::object()).empty());
  assert(compiler::boolean::compile(Json{{"type", "boolean"}}).size() == 1);
  assert(violation(Json{{"type", "boolean"}}, true).empty());
  assert(violation(Json{{"type", "boolean"}}, false).empty());
  assert(violation(Json{{"type", "boolean"}}, "true") == "type");
  std::cout << "  [PASS]\n";
}

// ============================================================================
// Common keywords
// ============================================================================

void test_null_and_union_types() {
  std::cout << "test_null_and_union_types...\n";
  assert(violation(Json{{"type", "null"}}, nullptr).empty());
  assert(violation(Json{{"type", "null"}}, 0) == "type");
  Json either = {{"type", Json::array({"string", "null"})}, {"maxLength", 2}};
  assert(violation(either, "ab").empty());
  assert(violation(either, nullptr).empty());
  assert(violation(either, 3) == "type");
  assert(violation(either, "abc") == "maxLength");
  std::cout << "  [PASS]\n";
}

void test_unknown_type_rejected() {
  std::cout << "test_unknown_type_rejected...\n";
  for (const Json& schema : {Json{{"type", "float"}}, Json{{"type", Json::array()}},
                             Json{{"type", 3}}, Json{{"type", Json::array({"string", "date"})}}}) {
    bool failed = false;
    try {
      compiler::common::compile(schema);
    } catch (const SchemaError& e) {
      failed = true;
      assert(e.keyword() == "type");
    }
    assert(failed);
  }
  std::cout << "  [PASS]\n";
}

void test_enum_and_const() {
  std::cout << "test_enum_and_const...\n";
  Json colors = {{"enum", Json::array({"red", "green", 3})}};
  assert(violation(colors, "red").empty());
  assert(violation(colors, 3).empty());
  assert(violation(colors, "blue") == "enum");
  assert(violation(Json{{"const", {{"a", 1}}}}, Json{{"a", 1}}).empty());
  assert(violation(Json{{"const", {{"a", 1}}}}, Json{{"a", 2}}) == "const");

  bool failed = false;
  try {
    compiler::common::compile(Json{{"enum", Json::array()}});
  } catch (const SchemaError&) {
    failed = true;
  }
  assert(failed);
  std::cout << "  [PASS]\n";
}

int main() {
  std::cout << "=== Predicates ===\n";
  test_predicates();
  std::cout << "\n=== Boolean ===\n";
  test_boolean_type();
  std::cout << "\n=== Common ===\n";
  test_null_and_union_types();
  test_unknown_type_rejected();
  test_enum_and_const();
  std::cout << "\n[OK] All common keyword tests passed!\n";
  return 0;
}
