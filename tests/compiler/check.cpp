#include <cassert>
#include <iostream>
#include <string>
#include "schemac/check_cache.hpp"
#include "schemac/compiler/check.hpp"
#include "schemac/schema.hpp"

using namespace schemac;

// ============================================================================
// Execution primitives: run_compiled and size_threshold
// ============================================================================

static CheckCache make_cache() {
  return CheckCache([](const Json& node) { return compile_node(node); });
}

void test_run_compiled_runs_in_order() {
  std::cout << "test_run_compiled_runs_in_order...\n";
  Json schema = Json::object();
  CheckCache cache([](const Json& node) { return compile_node(node); });
  std::string trace;
  CheckList checks{
    [&](const Json&, const SchemaRef&) { trace += "a"; },
    [&](const Json&, const SchemaRef&) { trace += "b"; },
    [&](const Json&, const SchemaRef&) { trace += "c"; },
  };
  run_compiled(Json(1), SchemaRef(schema, cache), checks);
  assert(trace == "abc");
  std::cout << "  [PASS]\n";
}

void test_run_compiled_stops_at_first_failure() {
  std::cout << "test_run_compiled_stops_at_first_failure...\n";
  Json schema = Json::object();
  CheckCache cache([](const Json& node) { return compile_node(node); });
  std::string trace;
  CheckList checks{
    [&](const Json&, const SchemaRef&) { trace += "a"; },
    [&](const Json&, const SchemaRef&) {
      trace += "b";
      throw ValidationError("minimum", Reason::OutOfRange, "boom");
    },
    [&](const Json&, const SchemaRef&) { trace += "c"; },
  };
  bool failed = false;
  try {
    run_compiled(Json(1), SchemaRef(schema, cache), checks);
  } catch (const ValidationError& e) {
    failed = true;
    assert(e.keyword() == "minimum");
    assert(std::string(e.what()) == "#minimum: boom");
  }
  assert(failed);
  assert(trace == "ab");
  std::cout << "  [PASS]\n";
}

void test_false_schema_rejects_before_checks() {
  std::cout << "test_false_schema_rejects_before_checks...\n";
  Json schema = false;
  CheckCache cache([](const Json& node) { return compile_node(node); });
  bool ran = false;
  CheckList checks{[&](const Json&, const SchemaRef&) { ran = true; }};
  for (const Json& value : {Json(nullptr), Json(0), Json("x"), Json::object()}) {
    bool failed = false;
    try {
      run_compiled(value, SchemaRef(schema, cache), checks);
    } catch (const ValidationError& e) {
      failed = true;
      assert(e.reason() == Reason::Invalid);
      assert(std::string(e.what()).rfind("#false:", 0) == 0);
    }
    assert(failed);
  }
  // also with an empty list
  bool failed = false;
  try {
    run_compiled(Json(nullptr), SchemaRef(schema, cache), CheckList{});
  } catch (const ValidationError&) {
    failed = true;
  }
  assert(failed);
  assert(!ran);
  std::cout << "  [PASS]\n";
}

void test_size_threshold_accepts_positive_integers() {
  std::cout << "test_size_threshold_accepts_positive_integers...\n";
  for (const Json& size : {Json(1), Json(7), Json(2.0), Json(100000)}) {
    auto max = size_threshold(size, "maxItems", SizeMode::Max);
    auto min = size_threshold(size, "minItems", SizeMode::Min);
    assert(max && min);
  }
  std::cout << "  [PASS]\n";
}

void test_size_threshold_rejects_bad_sizes() {
  std::cout << "test_size_threshold_rejects_bad_sizes...\n";
  for (const Json& size : {Json(0), Json(-3), Json(1.5), Json("2"), Json(nullptr), Json(true)}) {
    for (auto mode : {SizeMode::Max, SizeMode::Min}) {
      bool failed = false;
      try {
        size_threshold(size, "maxProperties", mode);
      } catch (const SchemaError& e) {
        failed = true;
        assert(e.keyword() == "maxProperties");
        assert(e.reason() == Reason::NotPositiveInteger);
        assert(std::string(e.what()) == "#maxProperties: keyword must be a positive integer");
      }
      assert(failed);
    }
  }
  std::cout << "  [PASS]\n";
}

void test_size_threshold_reads_limit_from_ref() {
  std::cout << "test_size_threshold_reads_limit_from_ref...\n";
  CheckCache cache = make_cache();
  // built with 5, but each node's own maxLength decides
  auto check = size_threshold(Json(5), "maxLength", SizeMode::Max);
  Json loose = {{"maxLength", 10}};
  Json tight = {{"maxLength", 2}};
  Measurement m;
  m.length = 4;
  check(m, SchemaRef(loose, cache));

  bool failed = false;
  try {
    check(m, SchemaRef(tight, cache));
  } catch (const ValidationError& e) {
    failed = true;
    assert(e.reason() == Reason::TooLong);
    assert(std::string(e.what()) == "#maxLength: value maximum exceeded");
  }
  assert(failed);
  std::cout << "  [PASS]\n";
}

void test_size_threshold_min_mode() {
  std::cout << "test_size_threshold_min_mode...\n";
  CheckCache cache = make_cache();
  auto check = size_threshold(Json(3), "minProperties", SizeMode::Min);
  Json schema = {{"minProperties", 3}};
  Measurement m;
  m.length = 3;
  check(m, SchemaRef(schema, cache));
  m.length = 2;
  bool failed = false;
  try {
    check(m, SchemaRef(schema, cache));
  } catch (const ValidationError& e) {
    failed = true;
    assert(std::string(e.what()) == "#minProperties: value minimum not met");
  }
  assert(failed);
  std::cout << "  [PASS]\n";
}

int main() {
  std::cout << "=== run_compiled ===\n";
  test_run_compiled_runs_in_order();
  test_run_compiled_stops_at_first_failure();
  test_false_schema_rejects_before_checks();

  std::cout << "\n=== size_threshold ===\n";
  test_size_threshold_accepts_positive_integers();
  test_size_threshold_rejects_bad_sizes();
  test_size_threshold_reads_limit_from_ref();
  test_size_threshold_min_mode();

  std::cout << "\n[OK] All execution primitive tests passed!\n";
  return 0;
}
