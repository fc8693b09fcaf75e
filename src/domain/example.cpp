#include "sqlrag/domain/example.h"

namespace sqlrag::domain {

std::optional<Complexity> parse_complexity(const std::string_view s) {
  if (s == "simple") {
    return Complexity::kSimple;
  }
  if (s == "medium") {
    return Complexity::kMedium;
  }
  if (s == "complex") {
    return Complexity::kComplex;
  }
  return std::nullopt;
}

std::string_view to_string(const Complexity c) {
  switch (c) {
    case Complexity::kSimple:
      return "simple";
    case Complexity::kMedium:
      return "medium";
    case Complexity::kComplex:
      return "complex";
  }
  return "medium";
}

int complexity_rank(const Complexity c) {
  switch (c) {
    case Complexity::kSimple:
      return 0;
    case Complexity::kMedium:
      return 1;
    case Complexity::kComplex:
      return 2;
  }
  return 1;
}

nlohmann::json example_to_json(const Example& example) {
  nlohmann::json j;
  if (!example.id.empty()) {
    j["id"] = example.id;
  }
  j["natural_query"] = example.natural_query;
  j["sql"] = example.sql;
  j["tables"] = example.tables;
  j["complexity"] = std::string(to_string(example.complexity));
  j["tags"] = example.tags;
  return j;
}

namespace {

using ExampleResult = core::Result<Example, core::ParseError>;

bool read_string_set(const nlohmann::json& j, const char* key, std::set<std::string>& out) {
  if (!j.contains(key)) {
    return true;
  }
  const auto& arr = j.at(key);
  if (!arr.is_array()) {
    return false;
  }
  for (const auto& item : arr) {
    if (!item.is_string()) {
      return false;
    }
    out.insert(item.get<std::string>());
  }
  return true;
}

}  // namespace

ExampleResult example_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return ExampleResult::err(core::ParseError::kInvalidFormat);
  }

  Example example;
  for (const char* key : {"natural_query", "sql"}) {
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get<std::string>().empty()) {
      return ExampleResult::err(core::ParseError::kMissingField);
    }
  }
  example.natural_query = j.at("natural_query").get<std::string>();
  example.sql = j.at("sql").get<std::string>();

  if (!j.contains("tables")) {
    return ExampleResult::err(core::ParseError::kMissingField);
  }
  if (!read_string_set(j, "tables", example.tables)) {
    return ExampleResult::err(core::ParseError::kInvalidFormat);
  }
  if (!read_string_set(j, "tags", example.tags)) {
    return ExampleResult::err(core::ParseError::kInvalidFormat);
  }

  if (j.contains("complexity") && j.at("complexity").is_string()) {
    example.complexity =
        parse_complexity(j.at("complexity").get<std::string>()).value_or(Complexity::kMedium);
  }
  if (j.contains("id") && j.at("id").is_string()) {
    example.id = j.at("id").get<std::string>();
  }

  return ExampleResult::ok(std::move(example));
}

}  // namespace sqlrag::domain
