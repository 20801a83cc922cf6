#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "schemac/schema.hpp"

using namespace schemac;

// ============================================================================
// Orchestrator: dispatch, lazy compile, memoization
// ============================================================================

static Json order_schema() {
  return Json{
    {"type", "object"},
    {"required", Json::array({"id", "lines"})},
    {"additionalProperties", false},
    {"properties", {
      {"id", {{"type", "integer"}, {"minimum", 1}}},
      {"note", {{"type", "string"}, {"maxLength", 20}}},
      {"lines", {
        {"type", "array"},
        {"minItems", 1},
        {"items", {
          {"type", "object"},
          {"required", Json::array({"sku", "qty"})},
          {"properties", {
            {"sku", {{"type", "string"}, {"pattern", "^[A-Z]{3}-[0-9]+$"}}},
            {"qty", {{"type", "integer"}, {"minimum", 1}}}
          }}
        }}
      }}
    }}
  };
}

void test_nested_validation() {
  std::cout << "test_nested_validation...\n";
  Schema schema(order_schema());
  Json good = {
    {"id", 7},
    {"lines", Json::array({Json{{"sku", "ABC-1"}, {"qty", 2}}})}
  };
  schema.validate(good);
  assert(schema.is_valid(good));

  Json bad_sku = good;
  bad_sku["lines"][0]["sku"] = "abc";
  bool failed = false;
  try {
    schema.validate(bad_sku);
  } catch (const ValidationError& e) {
    failed = true;
    assert(e.keyword() == "pattern");
  }
  assert(failed);

  Json missing_lines = {{"id", 7}};
  assert(!schema.is_valid(missing_lines));
  Json empty_lines = {{"id", 7}, {"lines", Json::array()}};
  assert(!schema.is_valid(empty_lines));
  std::cout << "  [PASS]\n";
}

void test_compiles_once_per_node() {
  std::cout << "test_compiles_once_per_node...\n";
  Schema schema(order_schema());
  std::map<std::string, int> compiled;
  schema.set_compile_observer(
      [&](const Json&, const std::string& pointer) { compiled[pointer]++; });
  assert(!schema.compiled());

  Json good = {{"id", 1}, {"lines", Json::array({Json{{"sku", "ABC-1"}, {"qty", 1}}})}};
  for (int i = 0; i < 5; ++i)
    schema.validate(good);
  assert(!schema.is_valid(Json{{"id", 0}}));

  // root, additionalProperties, id, note, lines, lines/items, sku, qty
  assert(compiled.size() == 8);
  for (const auto& [pointer, count] : compiled)
    assert(count == 1);
  assert(compiled.count(""));
  assert(compiled.count("/additionalProperties"));
  assert(compiled.count("/properties/lines/items/properties/sku"));
  assert(schema.compiled_nodes() == 8);
  std::cout << "  [PASS]\n";
}

void test_recompile_compiles_again() {
  std::cout << "test_recompile_compiles_again...\n";
  Schema schema(Json{{"properties", {{"a", {{"type", "string"}}}}}});
  int compiles = 0;
  schema.set_compile_observer([&](const Json&, const std::string&) { ++compiles; });
  schema.compile();
  schema.compile();
  assert(compiles == 2);
  schema.recompile();
  assert(compiles == 4);

  // structural change picked up after recompile
  schema.mutable_root()["properties"]["b"] = Json{{"type", "number"}};
  schema.recompile();
  assert(!schema.is_valid(Json{{"b", "x"}}));
  assert(schema.compiled_nodes() == 3);
  std::cout << "  [PASS]\n";
}

void test_same_node_compiles_equivalently() {
  std::cout << "test_same_node_compiles_equivalently...\n";
  Json node = {{"type", "number"}, {"minimum", 2}, {"multipleOf", 2}};
  CheckCache cache([](const Json& n) { return compile_node(n); });
  CheckList first = compile_node(node);
  CheckList second = compile_node(node);
  for (const Json& value : {Json(4), Json(3), Json(0), Json("x")}) {
    bool first_ok = true, second_ok = true;
    try {
      run_compiled(value, SchemaRef(node, cache), first);
    } catch (const ValidationError&) {
      first_ok = false;
    }
    try {
      run_compiled(value, SchemaRef(node, cache), second);
    } catch (const ValidationError&) {
      second_ok = false;
    }
    assert(first_ok == second_ok);
  }
  std::cout << "  [PASS]\n";
}

void test_false_and_true_roots() {
  std::cout << "test_false_and_true_roots...\n";
  Schema reject(false);
  for (const Json& value : {Json(nullptr), Json(1), Json::object(), Json::array()})
    assert(!reject.is_valid(value));
  Schema accept(true);
  assert(accept.is_valid(nullptr));
  assert(accept.is_valid(Json{{"anything", 1}}));
  std::cout << "  [PASS]\n";
}

void test_untyped_node_runs_every_compiler() {
  std::cout << "test_untyped_node_runs_every_compiler...\n";
  Schema schema(Json{{"maxLength", 2}, {"maximum", 2}, {"maxItems", 2}, {"maxProperties", 2}});
  assert(schema.is_valid("ab"));
  assert(!schema.is_valid("abc"));
  assert(schema.is_valid(2));
  assert(!schema.is_valid(3));
  assert(!schema.is_valid(Json::array({1, 2, 3})));
  assert(!schema.is_valid(Json{{"a", 1}, {"b", 2}, {"c", 3}}));
  assert(schema.is_valid(true));
  std::cout << "  [PASS]\n";
}

void test_typed_node_ignores_other_kinds() {
  std::cout << "test_typed_node_ignores_other_kinds...\n";
  // "maxLength" belongs to strings; an integer node never compiles it
  CheckList checks = compile_node(Json{{"type", "integer"}, {"maxLength", "junk"}});
  assert(checks.size() == 1);
  std::cout << "  [PASS]\n";
}

void test_compile_failure_leaves_nothing_cached() {
  std::cout << "test_compile_failure_leaves_nothing_cached...\n";
  Schema schema(Json{
    {"properties", {
      {"a", {{"type", "string"}}},
      {"z", {{"maxProperties", -1}}}
    }}
  });
  for (int attempt = 0; attempt < 2; ++attempt) {
    bool failed = false;
    try {
      schema.validate(Json::object());
    } catch (const SchemaError& e) {
      failed = true;
      assert(e.keyword() == "maxProperties");
      assert(e.reason() == Reason::NotPositiveInteger);
    }
    assert(failed);
    assert(!schema.compiled());
    assert(schema.compiled_nodes() == 0);
  }
  std::cout << "  [PASS]\n";
}

void test_invalid_node_shape() {
  std::cout << "test_invalid_node_shape...\n";
  bool failed = false;
  try {
    compile_node(Json(42));
  } catch (const SchemaError& e) {
    failed = true;
    assert(e.keyword() == "schema");
  }
  assert(failed);
  std::cout << "  [PASS]\n";
}

void test_eager_compile_setting() {
  std::cout << "test_eager_compile_setting...\n";
  Settings settings;
  settings.eager_compile = true;
  Schema schema(Json{{"type", "string"}}, settings);
  assert(schema.compiled());
  assert(schema.compiled_nodes() == 1);

  bool failed = false;
  try {
    Schema bad(Json{{"required", 5}}, settings);
  } catch (const SchemaError& e) {
    failed = true;
    assert(std::string(e.what()) ==
           "#required: required properties must be defined in an array of strings");
  }
  assert(failed);
  std::cout << "  [PASS]\n";
}

int main() {
  std::cout << "=== Schema ===\n";
  test_nested_validation();
  test_compiles_once_per_node();
  test_recompile_compiles_again();
  test_same_node_compiles_equivalently();
  test_false_and_true_roots();
  test_untyped_node_runs_every_compiler();
  test_typed_node_ignores_other_kinds();
  test_compile_failure_leaves_nothing_cached();
  test_invalid_node_shape();
  test_eager_compile_setting();
  std::cout << "\n[OK] All schema tests passed!\n";
  return 0;
}
