#include "sqlrag/ingest/example_loader.h"

#include "sqlrag/core/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>

namespace sqlrag::ingest {

namespace {

using domain::Complexity;
using domain::Example;

Example make_base(std::string natural_query, std::string sql, std::set<std::string> tables,
                  Complexity complexity, std::set<std::string> tags) {
  return Example{.id = "",
                 .natural_query = std::move(natural_query),
                 .sql = std::move(sql),
                 .tables = std::move(tables),
                 .complexity = complexity,
                 .tags = std::move(tags)};
}

void load_file(const std::filesystem::path& file, ExampleLoadReport& report) {
  std::ifstream in(file);
  if (!in) {
    report.errors.push_back("cannot read '" + file.string() + "'");
    return;
  }
  const auto data = nlohmann::json::parse(in, nullptr, false);
  if (data.is_discarded()) {
    report.errors.push_back("'" + file.string() + "' is not valid JSON");
    return;
  }

  const auto consider = [&report](const nlohmann::json& entry) {
    auto parsed = domain::example_from_json(entry);
    if (!parsed.has_value() || !is_loadable_example(parsed.value())) {
      ++report.skipped;
      return;
    }
    Example example = std::move(parsed.value());
    example.id.clear();
    report.examples.push_back(std::move(example));
  };

  if (data.is_array()) {
    for (const auto& entry : data) {
      consider(entry);
    }
  } else {
    consider(data);
  }
}

}  // namespace

std::vector<Example> base_examples() {
  return {
      make_base("查询所有用户信息", "SELECT * FROM users", {"users"}, Complexity::kSimple,
                {"select", "basic"}),
      make_base("查询价格大于100的商品名称和价格",
                "SELECT name, price FROM products WHERE price > 100", {"products"},
                Complexity::kSimple, {"select", "where", "comparison"}),
      make_base("统计每个分类的商品数量",
                "SELECT c.name, COUNT(p.id) as product_count FROM categories c LEFT JOIN "
                "products p ON c.id = p.category_id GROUP BY c.id",
                {"categories", "products"}, Complexity::kMedium, {"join", "group_by", "count"}),
      make_base("查询销量最高的10个商品",
                "SELECT p.name, SUM(oi.quantity) as total_sold FROM products p JOIN order_items "
                "oi ON p.id = oi.product_id GROUP BY p.id ORDER BY total_sold DESC LIMIT 10",
                {"products", "order_items"}, Complexity::kMedium,
                {"join", "group_by", "order_by", "limit", "sum"}),
      make_base("查询每个用户的订单总金额",
                "SELECT u.username, SUM(o.total_amount) as total_spent FROM users u JOIN orders "
                "o ON u.id = o.user_id GROUP BY u.id ORDER BY total_spent DESC",
                {"users", "orders"}, Complexity::kMedium, {"join", "group_by", "order_by", "sum"}),
      make_base("查询没有下过订单的用户",
                "SELECT * FROM users WHERE id NOT IN (SELECT DISTINCT user_id FROM orders)",
                {"users", "orders"}, Complexity::kComplex, {"subquery", "not_in"}),
      make_base("查询评分最高的5个商品及其评分",
                "SELECT p.name, AVG(r.rating) as avg_rating, COUNT(r.id) as review_count FROM "
                "products p JOIN reviews r ON p.id = r.product_id GROUP BY p.id HAVING "
                "COUNT(r.id) >= 3 ORDER BY avg_rating DESC LIMIT 5",
                {"products", "reviews"}, Complexity::kComplex,
                {"join", "group_by", "having", "avg", "order_by", "limit"}),
      make_base("查询2024年每月的销售额",
                "SELECT strftime('%Y-%m', created_at) as month, SUM(total_amount) as "
                "monthly_sales FROM orders WHERE strftime('%Y', created_at) = '2024' GROUP BY "
                "month ORDER BY month",
                {"orders"}, Complexity::kMedium, {"date_format", "group_by", "sum", "where"}),
      make_base("查询购买了特定商品的所有用户",
                "SELECT DISTINCT u.* FROM users u JOIN orders o ON u.id = o.user_id JOIN "
                "order_items oi ON o.id = oi.order_id WHERE oi.product_id = ?",
                {"users", "orders", "order_items"}, Complexity::kComplex,
                {"join", "distinct", "parameter"}),
      make_base("统计各状态的订单数量",
                "SELECT status, COUNT(*) as order_count FROM orders GROUP BY status", {"orders"},
                Complexity::kSimple, {"group_by", "count"}),
  };
}

bool is_loadable_example(const Example& example) {
  return !example.natural_query.empty() && !example.sql.empty() && !example.tables.empty();
}

ExampleLoadReport load_examples_from_path(const std::filesystem::path& path) {
  ExampleLoadReport report;
  std::error_code ec;

  if (std::filesystem::is_regular_file(path, ec)) {
    load_file(path, report);
    return report;
  }
  if (!std::filesystem::is_directory(path, ec)) {
    return report;
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") {
      continue;
    }
    if (entry.path().filename().string().rfind("faiss", 0) == 0) {
      continue;
    }
    files.push_back(entry.path());
  }
  if (ec) {
    report.errors.push_back("cannot list '" + path.string() + "': " + ec.message());
  }
  std::sort(files.begin(), files.end());

  for (const auto& file : files) {
    load_file(file, report);
  }
  return report;
}

std::size_t save_examples_to_file(const std::vector<Example>& examples,
                                  const std::filesystem::path& path) {
  nlohmann::json existing = nlohmann::json::array();
  if (std::filesystem::exists(path)) {
    std::ifstream in(path);
    if (!in) {
      throw core::PersistenceError("cannot read '" + path.string() + "'");
    }
    existing = nlohmann::json::parse(in, nullptr, false);
    if (existing.is_discarded() || !existing.is_array()) {
      throw core::PersistenceError("'" + path.string() + "' is not a JSON array of examples");
    }
  }

  std::set<std::string> known_sql;
  for (const auto& entry : existing) {
    if (entry.is_object() && entry.contains("sql") && entry.at("sql").is_string()) {
      known_sql.insert(entry.at("sql").get<std::string>());
    }
  }

  std::size_t appended = 0;
  for (const auto& example : examples) {
    if (!known_sql.insert(example.sql).second) {
      continue;
    }
    nlohmann::json entry = domain::example_to_json(example);
    entry.erase("id");
    existing.push_back(std::move(entry));
    ++appended;
  }

  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw core::PersistenceError("cannot create '" + path.parent_path().string() +
                                   "': " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw core::PersistenceError("cannot open '" + path.string() + "' for writing");
  }
  out << existing.dump(2) << "\n";
  if (!out) {
    throw core::PersistenceError("short write to '" + path.string() + "'");
  }
  return appended;
}

}  // namespace sqlrag::ingest
