#pragma once

#include "sqlrag/domain/example.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sqlrag::ingest {

// Hand-written seed examples over a small e-commerce schema (users, products,
// categories, orders, order_items, reviews).
[[nodiscard]] std::vector<domain::Example> base_examples();

struct ExampleLoadReport {
  std::vector<domain::Example> examples;  // NOLINT(readability-identifier-naming)
  std::size_t skipped{0};                 // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;        // NOLINT(readability-identifier-naming)
};

// A loadable example needs a non-empty natural_query, sql and tables list.
[[nodiscard]] bool is_loadable_example(const domain::Example& example);

// Loads examples from a JSON file, or from every *.json file of a directory (sorted by
// name, files starting with "faiss" skipped). Each file holds an array of examples or a
// single example object. Invalid entries are counted in skipped; unreadable files are
// reported in errors. A missing path yields an empty report.
[[nodiscard]] ExampleLoadReport load_examples_from_path(const std::filesystem::path& path);

// Merges examples into the JSON array at path, skipping any whose SQL is already
// present (existing entries are kept verbatim). Creates parent directories.
// Returns the number of examples appended. Throws core::PersistenceError when the
// existing file cannot be parsed or the file cannot be written.
std::size_t save_examples_to_file(const std::vector<domain::Example>& examples,
                                  const std::filesystem::path& path);

}  // namespace sqlrag::ingest
