#include "sqlrag/core/errors.h"
#include "sqlrag/retrieval/example_store.h"

#include "support/fakes.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace sqlrag;
using domain::Complexity;
using domain::Example;

namespace {

constexpr std::size_t kDim = 128;

Example make_example(std::string query, std::string sql, std::set<std::string> tables,
                     Complexity complexity = Complexity::kMedium) {
  return Example{.id = "",
                 .natural_query = std::move(query),
                 .sql = std::move(sql),
                 .tables = std::move(tables),
                 .complexity = complexity,
                 .tags = {}};
}

struct StoreFixture {
  embedding::DeterministicStubEmbeddingProvider embedder{kDim};
  vector::VectorIndex index{kDim};
  retrieval::ExampleStore store{embedder, index};

  void seed() {
    store.add({
        make_example("查询所有用户信息", "SELECT * FROM users", {"users"}, Complexity::kSimple),
        make_example("查询价格大于100的商品名称和价格",
                     "SELECT name, price FROM products WHERE price > 100", {"products"},
                     Complexity::kSimple),
        make_example("统计每个分类的商品数量",
                     "SELECT c.name, COUNT(p.id) FROM categories c LEFT JOIN products p ON c.id = "
                     "p.category_id GROUP BY c.id",
                     {"categories", "products"}, Complexity::kMedium),
        make_example("查询每个用户的订单总金额",
                     "SELECT u.username, SUM(o.total_amount) FROM users u JOIN orders o ON u.id = "
                     "o.user_id GROUP BY u.id",
                     {"users", "orders"}, Complexity::kMedium),
        make_example("查询购买了所有分类商品的用户",
                     "SELECT u.username FROM users u WHERE NOT EXISTS (SELECT 1 FROM categories)",
                     {"users", "categories"}, Complexity::kComplex),
    });
  }
};

}  // namespace

TEST_CASE("ExampleStore on an empty store returns nothing", "[retrieval][store]") {
  testing::FailingEmbeddingProvider failing(kDim);
  vector::VectorIndex index(kDim);
  retrieval::ExampleStore store(failing, index);

  // No embedding call is made for an empty store.
  const auto results = store.retrieve(
      {.text = "query all products", .relevant_tables = std::set<std::string>{"products"}, .k = 3,
       .complexity_hint = std::nullopt});
  CHECK(results.empty());
}

TEST_CASE("ExampleStore ranks an exact query first", "[retrieval][store]") {
  StoreFixture f;
  const auto ids = f.store.add(
      {make_example("查询所有商品", "SELECT * FROM products", {"products"}, Complexity::kSimple)});
  REQUIRE(ids.size() == 1);

  const auto results = f.store.retrieve({.text = "查询所有商品",
                                         .relevant_tables = std::set<std::string>{"products"},
                                         .k = 3,
                                         .complexity_hint = std::nullopt});
  REQUIRE(results.size() == 1);
  CHECK(results[0].example.id == ids[0]);
  CHECK(results[0].example.sql == "SELECT * FROM products");
  CHECK_THAT(results[0].score, Catch::Matchers::WithinAbs(1.0, 1e-4));

  f.seed();
  const auto ranked = f.store.retrieve(
      {.text = "查询所有商品", .relevant_tables = std::nullopt, .k = 3, .complexity_hint = std::nullopt});
  REQUIRE_FALSE(ranked.empty());
  CHECK(ranked[0].example.id == ids[0]);
}

TEST_CASE("ExampleStore filters by relevant tables", "[retrieval][store]") {
  StoreFixture f;
  f.seed();

  const auto results = f.store.retrieve({.text = "查询用户订单",
                                         .relevant_tables = std::set<std::string>{"orders"},
                                         .k = 5,
                                         .complexity_hint = std::nullopt});
  REQUIRE_FALSE(results.empty());
  for (const auto& r : results) {
    CHECK(r.example.tables.count("orders") == 1);
  }

  SECTION("an empty table set matches everything") {
    const auto all = f.store.retrieve({.text = "查询",
                                       .relevant_tables = std::set<std::string>{},
                                       .k = 5,
                                       .complexity_hint = std::nullopt});
    CHECK(all.size() == 5);
  }

  SECTION("an unknown table matches nothing") {
    const auto none = f.store.retrieve({.text = "查询",
                                        .relevant_tables = std::set<std::string>{"invoices"},
                                        .k = 5,
                                        .complexity_hint = std::nullopt});
    CHECK(none.empty());
  }
}

TEST_CASE("ExampleStore returns at most k results by adjusted score", "[retrieval][store]") {
  StoreFixture f;
  f.seed();

  for (std::size_t k : {1U, 2U, 3U}) {
    const auto results = f.store.retrieve(
        {.text = "查询用户", .relevant_tables = std::nullopt, .k = k, .complexity_hint = std::nullopt});
    REQUIRE(results.size() <= k);
    for (std::size_t i = 1; i < results.size(); ++i) {
      CHECK(results[i - 1].adjusted_score >= results[i].adjusted_score);
    }
    for (const auto& r : results) {
      CHECK(r.adjusted_score == r.score);
    }
  }
}

TEST_CASE("ExampleStore complexity hint penalizes distant examples", "[retrieval][store]") {
  StoreFixture f;
  f.seed();

  const auto results = f.store.retrieve({.text = "查询用户",
                                         .relevant_tables = std::nullopt,
                                         .k = 5,
                                         .complexity_hint = Complexity::kComplex});
  REQUIRE_FALSE(results.empty());
  for (std::size_t i = 1; i < results.size(); ++i) {
    CHECK(results[i - 1].adjusted_score >= results[i].adjusted_score);
  }
  for (const auto& r : results) {
    const int distance = domain::complexity_rank(Complexity::kComplex) -
                         domain::complexity_rank(r.example.complexity);
    CHECK_THAT(r.adjusted_score, Catch::Matchers::WithinAbs(r.score - (0.1 * distance), 1e-9));
  }
}

TEST_CASE("ExampleStore deduplicates by exact SQL text", "[retrieval][store]") {
  StoreFixture f;

  CHECK(f.store.add({make_example("all users", "SELECT * FROM users", {"users"})}).size() == 1);
  CHECK(f.store.add({make_example("every user", "SELECT * FROM users", {"users"})}).empty());
  CHECK(f.store.count() == 1);

  SECTION("within one batch") {
    const auto ids = f.store.add({make_example("a", "SELECT 1", {"t"}),
                                  make_example("b", "SELECT 1", {"t"})});
    CHECK(ids.size() == 1);
    CHECK(f.store.count() == 2);
  }

  SECTION("different whitespace is a different SQL text") {
    CHECK(f.store.add({make_example("all users", "SELECT *  FROM users", {"users"})}).size() == 1);
  }
}

TEST_CASE("ExampleStore propagates embedding failures on add", "[retrieval][store]") {
  testing::FailingEmbeddingProvider failing(kDim);
  vector::VectorIndex index(kDim);
  retrieval::ExampleStore store(failing, index);

  CHECK_THROWS_AS(store.add({make_example("q", "SELECT 1", {"t"})}), core::EmbeddingError);
  CHECK(store.count() == 0);
  CHECK_FALSE(store.contains_sql("SELECT 1"));
}

TEST_CASE("ExampleStore rejects a provider of another dimension", "[retrieval][store]") {
  embedding::DeterministicStubEmbeddingProvider embedder(64);
  vector::VectorIndex index(128);
  CHECK_THROWS_AS(retrieval::ExampleStore(embedder, index), core::IndexError);
}

TEST_CASE("ExampleStore save and load keep ranking and dedup", "[retrieval][store][persistence]") {
  testing::TempDir dir("sqlrag-store");
  StoreFixture original;
  original.seed();
  original.store.save(dir.path());

  StoreFixture restored;
  restored.store.load(dir.path());
  REQUIRE(restored.store.count() == original.store.count());
  CHECK(restored.store.contains_sql("SELECT * FROM users"));

  const retrieval::RetrievalQuery query{
      .text = "统计商品", .relevant_tables = std::nullopt, .k = 5, .complexity_hint = std::nullopt};
  const auto before = original.store.retrieve(query);
  const auto after = restored.store.retrieve(query);
  REQUIRE(before.size() == after.size());
  for (std::size_t i = 0; i < before.size(); ++i) {
    CHECK(before[i].example.id == after[i].example.id);
  }

  const auto listed = restored.store.list();
  REQUIRE(listed.size() == 5);
  CHECK(listed[0].natural_query == "查询所有用户信息");
}

TEST_CASE("format_examples_for_prompt renders the examples block", "[retrieval][store]") {
  CHECK(retrieval::format_examples_for_prompt({}).empty());

  retrieval::ScoredExample scored{
      .example = make_example("查询所有用户信息", "SELECT * FROM users", {"users"}),
      .score = 0.9,
      .adjusted_score = 0.9};
  const auto text = retrieval::format_examples_for_prompt({scored});
  CHECK(text.find("## Similar SQL Examples") == 0);
  CHECK(text.find("### Example 1") != std::string::npos);
  CHECK(text.find("**Query**: 查询所有用户信息") != std::string::npos);
  CHECK(text.find("**Tables**: users") != std::string::npos);
  CHECK(text.find("```sql\nSELECT * FROM users\n```") != std::string::npos);
}
