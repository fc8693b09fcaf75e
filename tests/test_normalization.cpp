#include "sqlrag/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace sqlrag::core;

TEST_CASE("normalize_ascii_lower folds ASCII only", "[core][normalization]") {
  CHECK(normalize_ascii_lower("SELECT Name") == "select name");
  CHECK(normalize_ascii_lower("查询ABC") == "查询abc");
}

TEST_CASE("tokenize_text splits ASCII runs and CJK code points", "[core][normalization]") {
  SECTION("ASCII words are lower-cased and short ones dropped") {
    const auto tokens = tokenize_text("Hello, World 42 a");
    CHECK(tokens == std::vector<std::string>{"hello", "world", "42"});
  }

  SECTION("each CJK code point is a token") {
    const auto tokens = tokenize_text("查询users");
    CHECK(tokens == std::vector<std::string>{"查", "询", "users"});
  }

  SECTION("min length of 1 keeps single letters") {
    const auto tokens = tokenize_text("a b", 1);
    CHECK(tokens == std::vector<std::string>{"a", "b"});
  }
}

TEST_CASE("trim and split_trimmed", "[core][normalization]") {
  CHECK(trim("  \tusers \n") == "users");
  CHECK(trim("   ").empty());
  CHECK(split_trimmed(" users, orders ,,products ", ',') ==
        std::vector<std::string>{"users", "orders", "products"});
  CHECK(split_trimmed("", ',').empty());
}

TEST_CASE("join concatenates with a separator", "[core][normalization]") {
  CHECK(join(std::vector<std::string>{"a", "b", "c"}, ", ") == "a, b, c");
  CHECK(join(std::vector<std::string>{}, ", ").empty());
}

TEST_CASE("starts_with_keyword_ci matches whole words", "[core][normalization]") {
  CHECK(starts_with_keyword_ci("  select * from t", "SELECT"));
  CHECK(starts_with_keyword_ci("(SELECT 1)", "SELECT"));
  CHECK(starts_with_keyword_ci("WITH x AS (SELECT 1) SELECT * FROM x", "WITH"));
  CHECK_FALSE(starts_with_keyword_ci("selection", "SELECT"));
  CHECK_FALSE(starts_with_keyword_ci("DELETE FROM t", "SELECT"));
  CHECK_FALSE(starts_with_keyword_ci("", "SELECT"));
}
