#include "sqlrag/domain/example.h"

#include <catch2/catch_test_macros.hpp>

using namespace sqlrag;
using domain::Complexity;

TEST_CASE("Complexity vocabulary and ranks", "[domain][example]") {
  CHECK(domain::parse_complexity("simple") == std::optional{Complexity::kSimple});
  CHECK(domain::parse_complexity("complex") == std::optional{Complexity::kComplex});
  CHECK_FALSE(domain::parse_complexity("hard").has_value());
  CHECK(domain::to_string(Complexity::kMedium) == "medium");
  CHECK(domain::complexity_rank(Complexity::kSimple) < domain::complexity_rank(Complexity::kMedium));
  CHECK(domain::complexity_rank(Complexity::kMedium) <
        domain::complexity_rank(Complexity::kComplex));
}

TEST_CASE("Example JSON form", "[domain][example]") {
  const domain::Example example{.id = "",
                                .natural_query = "查询所有用户信息",
                                .sql = "SELECT * FROM users",
                                .tables = {"users"},
                                .complexity = Complexity::kSimple,
                                .tags = {"basic"}};

  const auto j = domain::example_to_json(example);
  CHECK_FALSE(j.contains("id"));
  CHECK(j.at("complexity") == "simple");
  CHECK(j.at("tables") == nlohmann::json::array({"users"}));

  const auto parsed = domain::example_from_json(j);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().natural_query == example.natural_query);
  CHECK(parsed.value().sql == example.sql);
  CHECK(parsed.value().tables == example.tables);
  CHECK(parsed.value().tags == example.tags);
}

TEST_CASE("example_from_json applies defaults", "[domain][example]") {
  const auto parsed = domain::example_from_json(
      {{"natural_query", "q"}, {"sql", "SELECT 1"}, {"tables", nlohmann::json::array()},
       {"complexity", "extreme"}});
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().complexity == Complexity::kMedium);
  CHECK(parsed.value().tags.empty());
  CHECK(parsed.value().tables.empty());
}

TEST_CASE("example_from_json rejects incomplete entries", "[domain][example]") {
  CHECK(domain::example_from_json(nlohmann::json::array()).error() ==
        core::ParseError::kInvalidFormat);
  CHECK(domain::example_from_json({{"sql", "SELECT 1"}, {"tables", {"t"}}}).error() ==
        core::ParseError::kMissingField);
  CHECK(domain::example_from_json({{"natural_query", ""}, {"sql", "SELECT 1"}, {"tables", {"t"}}})
            .error() == core::ParseError::kMissingField);
  CHECK(domain::example_from_json({{"natural_query", "q"}, {"sql", "SELECT 1"}}).error() ==
        core::ParseError::kMissingField);
  CHECK(domain::example_from_json({{"natural_query", "q"}, {"sql", "SELECT 1"}, {"tables", "t"}})
            .error() == core::ParseError::kInvalidFormat);
}
