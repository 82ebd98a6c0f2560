#include <string>

#include <nlohmann/json.hpp>

#include "partialjson/fields_parser.h"
#include "partialjson/json_filter.h"
#include "test_harness.h"

namespace {

using nlohmann::json;
using partialjson::Path;
using partialjson::PathFilter;

json filter(const json& doc, const std::string& selector, bool ci = false) {
  auto result = partialjson::parse_fields(selector);
  expect_true(result.is_present(), "parses: " + selector);
  if (!result.is_present()) return doc;
  return partialjson::filter_json(doc, *result.selection, ci);
}

void test_filter_list_scenario() {
  json doc = json::parse(R"({"kind":"list","items":[{"title":"t","id":1,"extra":"x"}],"next":"n"})");
  json out = filter(doc, "kind,items(title,id)");
  json expected = json::parse(R"({"kind":"list","items":[{"title":"t","id":1}]})");
  expect_true(out == expected, "kind and items[].title/id kept, extra and next dropped: " + out.dump());
}

void test_filter_every_array_element() {
  json doc = json::parse(R"({"items":[{"id":1,"x":0},{"id":2,"x":0},{"id":3}]})");
  json out = filter(doc, "items/id");
  json expected = json::parse(R"({"items":[{"id":1},{"id":2},{"id":3}]})");
  expect_true(out == expected, "each element filtered: " + out.dump());
}

void test_filter_ancestors_emitted() {
  json doc = json::parse(R"({"a":{"b":{"c":1,"d":2},"e":3},"f":4})");
  json out = filter(doc, "a/b/c");
  json expected = json::parse(R"({"a":{"b":{"c":1}}})");
  expect_true(out == expected, "containers on the way to a/b/c kept: " + out.dump());
}

void test_filter_leaf_keeps_whole_object() {
  json doc = json::parse(R"({"owner":{"name":"n","email":"e"},"id":1})");
  json out = filter(doc, "owner");
  json expected = json::parse(R"({"owner":{"name":"n","email":"e"}})");
  expect_true(out == expected, "bare field keeps its whole object: " + out.dump());
}

void test_filter_wildcard() {
  json doc = json::parse(R"({"a":{"x":1,"y":{"z":2}},"b":1})");
  expect_true(filter(doc, "a(*)") == json::parse(R"({"a":{"x":1,"y":{"z":2}}})"), "a(*) keeps all of a");
  expect_true(filter(doc, "*") == doc, "root wildcard keeps everything");
  json restricted = filter(doc, "a(x),*");
  expect_true(restricted == json::parse(R"({"a":{"x":1},"b":1})"), "explicit sibling restricted: " + restricted.dump());
}

void test_filter_empty_selector_identity() {
  json doc = json::parse(R"({"a":[1,2,{"b":null}],"c":true})");
  expect_true(filter(doc, "") == doc, "empty selector is identity");
}

void test_filter_case_insensitive() {
  json doc = json::parse(R"({"name":"n","Other":1})");
  expect_true(filter(doc, "NAME", true) == json::parse(R"({"name":"n"})"), "case-insensitive keeps name");
  expect_true(filter(doc, "NAME", false) == json::object(), "case-sensitive drops name");
}

void test_filter_root_array() {
  json doc = json::parse(R"([{"id":1,"x":2},{"id":3}])");
  json out = filter(doc, "id");
  expect_true(out == json::parse(R"([{"id":1},{"id":3}])"), "root array elements filtered: " + out.dump());
}

void test_filter_scalars_untouched() {
  json doc = json::parse(R"({"s":"text","n":1.5,"b":false,"z":null,"u":"é"})");
  json out = filter(doc, "s,n,b,z,u");
  expect_true(out == doc, "scalar values copied as-is");
}

void test_filter_custom_predicate() {
  json doc = json::parse(R"({"keep":1,"drop":2,"nested":{"keep":3,"drop":4}})");
  std::vector<std::string> seen;
  PathFilter custom;
  custom.include = [&seen](const Path& path) {
    seen.push_back(partialjson::path_to_string(path));
    return path.back().name != "drop";
  };
  json out = partialjson::filter_json(doc, custom);
  expect_true(out == json::parse(R"({"keep":1,"nested":{"keep":3}})"), "custom include: " + out.dump());
  expect_eq(seen.size(), 5, "predicate called once per candidate");
}

void test_filter_without_predicate_is_identity() {
  json doc = json::parse(R"({"a":1})");
  expect_true(partialjson::filter_json(doc, PathFilter{}) == doc, "empty filter keeps everything");
}

void test_stored_filter_outlives_selection() {
  PathFilter stored;
  {
    auto result = partialjson::parse_fields("a(b)");
    expect_true(result.is_present(), "parses: a(b)");
    if (!result.is_present()) return;
    stored = partialjson::make_path_filter(*result.selection, false);
  }
  json doc = json::parse(R"({"a":{"b":1,"c":2},"d":3})");
  json out = partialjson::filter_json(doc, stored);
  expect_true(out == json::parse(R"({"a":{"b":1}})"), "stored filter keeps its own tree: " + out.dump());
}

}  // namespace

void register_json_filter_tests(std::vector<TestCase>& tests) {
  tests.push_back({"filter_list_scenario", test_filter_list_scenario});
  tests.push_back({"filter_every_array_element", test_filter_every_array_element});
  tests.push_back({"filter_ancestors_emitted", test_filter_ancestors_emitted});
  tests.push_back({"filter_leaf_keeps_whole_object", test_filter_leaf_keeps_whole_object});
  tests.push_back({"filter_wildcard", test_filter_wildcard});
  tests.push_back({"filter_empty_selector_identity", test_filter_empty_selector_identity});
  tests.push_back({"filter_case_insensitive", test_filter_case_insensitive});
  tests.push_back({"filter_root_array", test_filter_root_array});
  tests.push_back({"filter_scalars_untouched", test_filter_scalars_untouched});
  tests.push_back({"filter_custom_predicate", test_filter_custom_predicate});
  tests.push_back({"filter_without_predicate_is_identity", test_filter_without_predicate_is_identity});
  tests.push_back({"stored_filter_outlives_selection", test_stored_filter_outlives_selection});
}
