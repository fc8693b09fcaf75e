#pragma once

#include "sqlrag/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

namespace sqlrag::testing {

// Creates a small e-commerce database at path (users, products, orders).
inline void create_shop_db(const std::filesystem::path& path) {
  auto opened = storage::sqlite::SqliteDb::open(path.string());
  REQUIRE(opened.has_value());
  auto db = opened.value();
  const auto created = db->exec(R"(
    CREATE TABLE users (
      id INTEGER PRIMARY KEY,
      username TEXT NOT NULL,
      email TEXT,
      created_at TEXT DEFAULT CURRENT_TIMESTAMP
    );
    CREATE TABLE products (
      id INTEGER PRIMARY KEY,
      name TEXT NOT NULL,
      price REAL NOT NULL
    );
    CREATE TABLE orders (
      id INTEGER PRIMARY KEY,
      user_id INTEGER NOT NULL REFERENCES users(id),
      total_amount REAL
    );
    INSERT INTO users (id, username, email) VALUES
      (1, 'alice', 'alice@example.com'),
      (2, 'bob', NULL),
      (3, 'carol', 'carol@example.com');
    INSERT INTO products (id, name, price) VALUES
      (1, 'keyboard', 49.5), (2, 'monitor', 199.0), (3, 'cable', 5.0),
      (4, 'desk', 350.0), (5, 'lamp', 25.0);
    INSERT INTO orders (id, user_id, total_amount) VALUES (1, 1, 249.0), (2, 3, 5.0);
  )");
  REQUIRE(created.has_value());
}

}  // namespace sqlrag::testing
