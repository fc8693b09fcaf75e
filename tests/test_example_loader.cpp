#include "sqlrag/core/errors.h"
#include "sqlrag/ingest/example_loader.h"

#include "support/fakes.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

using namespace sqlrag;

namespace {

void write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

}  // namespace

TEST_CASE("base_examples are complete and distinct", "[ingest][loader]") {
  const auto examples = ingest::base_examples();
  REQUIRE(examples.size() == 10);

  std::set<std::string> sqls;
  for (const auto& e : examples) {
    CHECK(ingest::is_loadable_example(e));
    CHECK(e.id.empty());
    sqls.insert(e.sql);
  }
  CHECK(sqls.size() == examples.size());
}

TEST_CASE("load_examples_from_path reads an array file and skips invalid entries",
          "[ingest][loader]") {
  testing::TempDir dir("sqlrag-loader");
  const auto file = dir.path() / "examples.json";
  write_file(file, R"([
    {"natural_query": "查询所有商品", "sql": "SELECT * FROM products", "tables": ["products"],
     "complexity": "simple", "tags": ["select"]},
    {"natural_query": "", "sql": "SELECT 1", "tables": ["t"]},
    {"natural_query": "no tables", "sql": "SELECT 2", "tables": []},
    {"sql": "SELECT 3"},
    42
  ])");

  const auto report = ingest::load_examples_from_path(file);
  REQUIRE(report.examples.size() == 1);
  CHECK(report.examples[0].natural_query == "查询所有商品");
  CHECK(report.examples[0].complexity == domain::Complexity::kSimple);
  CHECK(report.skipped == 4);
  CHECK(report.errors.empty());
}

TEST_CASE("load_examples_from_path reads a directory in name order", "[ingest][loader]") {
  testing::TempDir dir("sqlrag-loader");
  write_file(dir.path() / "b.json",
             R"({"natural_query": "b", "sql": "SELECT b FROM t", "tables": ["t"]})");
  write_file(dir.path() / "a.json",
             R"([{"natural_query": "a", "sql": "SELECT a FROM t", "tables": ["t"]}])");
  write_file(dir.path() / "faiss_metadata.json",
             R"([{"natural_query": "x", "sql": "SELECT x FROM t", "tables": ["t"]}])");
  write_file(dir.path() / "notes.txt", "ignored");
  write_file(dir.path() / "broken.json", "[{");

  const auto report = ingest::load_examples_from_path(dir.path());
  REQUIRE(report.examples.size() == 2);
  CHECK(report.examples[0].natural_query == "a");
  CHECK(report.examples[1].natural_query == "b");
  REQUIRE(report.errors.size() == 1);
  CHECK(report.errors[0].find("broken.json") != std::string::npos);
}

TEST_CASE("load_examples_from_path on a missing path is empty", "[ingest][loader]") {
  testing::TempDir dir("sqlrag-loader");
  const auto report = ingest::load_examples_from_path(dir.path() / "absent.json");
  CHECK(report.examples.empty());
  CHECK(report.errors.empty());
}

TEST_CASE("save_examples_to_file merges and deduplicates by SQL", "[ingest][loader]") {
  testing::TempDir dir("sqlrag-loader");
  const auto file = dir.path() / "nested" / "learned.json";
  const auto examples = ingest::base_examples();

  CHECK(ingest::save_examples_to_file({examples[0], examples[1]}, file) == 2);
  CHECK(ingest::save_examples_to_file({examples[1], examples[2]}, file) == 1);

  std::ifstream in(file);
  const auto saved = nlohmann::json::parse(in);
  REQUIRE(saved.is_array());
  CHECK(saved.size() == 3);
  CHECK_FALSE(saved[0].contains("id"));

  const auto report = ingest::load_examples_from_path(file);
  CHECK(report.examples.size() == 3);
}

TEST_CASE("save_examples_to_file refuses to overwrite a corrupt file", "[ingest][loader]") {
  testing::TempDir dir("sqlrag-loader");
  const auto file = dir.path() / "learned.json";
  write_file(file, "{ corrupt");

  CHECK_THROWS_AS(ingest::save_examples_to_file(ingest::base_examples(), file),
                  core::PersistenceError);

  std::ifstream in(file);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  CHECK(content == "{ corrupt");
}
