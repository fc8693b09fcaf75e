#include "sqlrag/retrieval/example_store.h"

#include "sqlrag/core/errors.h"
#include "sqlrag/core/normalization.h"

#include <algorithm>
#include <cstdlib>

namespace sqlrag::retrieval {

std::optional<domain::Example> example_from_document(const vector::IndexedDocument& doc) {
  auto parsed = domain::example_from_json(doc.metadata);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  domain::Example example = parsed.value();
  example.id = doc.id;
  return example;
}

ExampleStore::ExampleStore(embedding::IEmbeddingProvider& embedder, vector::VectorIndex& index,
                           RetrievalConfig config)
    : embedder_(embedder), index_(index), config_(config) {
  if (embedder_.dimension() != index_.dimension()) {
    throw core::IndexError(core::IndexErrorKind::kDimensionMismatch,
                           "embedding provider dimension " +
                               std::to_string(embedder_.dimension()) +
                               " does not match index dimension " +
                               std::to_string(index_.dimension()));
  }
  rebuild_sql_set();
}

std::vector<ScoredExample> ExampleStore::retrieve(const RetrievalQuery& query) const {
  if (index_.count() == 0 || query.k == 0) {
    return {};
  }

  const vector::Vector query_vector = embedder_.embed_text(query.text);

  vector::DocumentPredicate schema_filter;
  if (query.relevant_tables.has_value() && !query.relevant_tables->empty()) {
    const std::set<std::string>& wanted = *query.relevant_tables;
    schema_filter = [&wanted](const vector::IndexedDocument& doc) {
      const auto it = doc.metadata.find("tables");
      if (it == doc.metadata.end() || !it->is_array()) {
        return false;
      }
      return std::any_of(it->begin(), it->end(), [&wanted](const nlohmann::json& t) {
        return t.is_string() && wanted.count(t.get<std::string>()) > 0;
      });
    };
  }

  const std::size_t candidates = query.k * std::max<std::size_t>(config_.overfetch_multiplier, 1);
  const auto hits = index_.search(query_vector, candidates, schema_filter,
                                  config_.overfetch_multiplier);

  std::vector<ScoredExample> results;
  results.reserve(hits.size());
  for (const auto& hit : hits) {
    auto example = example_from_document(hit.document);
    if (!example.has_value()) {
      continue;
    }
    results.push_back(ScoredExample{
        .example = std::move(*example), .score = hit.score, .adjusted_score = hit.score});
  }

  if (query.complexity_hint.has_value()) {
    const int target = domain::complexity_rank(*query.complexity_hint);
    for (auto& r : results) {
      const int distance = std::abs(target - domain::complexity_rank(r.example.complexity));
      r.adjusted_score = r.score - (config_.complexity_penalty * distance);
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const ScoredExample& a, const ScoredExample& b) {
                       return a.adjusted_score > b.adjusted_score;
                     });
  }

  if (results.size() > query.k) {
    results.resize(query.k);
  }
  return results;
}

std::vector<std::string> ExampleStore::add(const std::vector<domain::Example>& examples) {
  std::vector<const domain::Example*> fresh;
  std::unordered_set<std::string> batch_sqls;
  for (const auto& example : examples) {
    if (sqls_.count(example.sql) > 0 || !batch_sqls.insert(example.sql).second) {
      continue;
    }
    fresh.push_back(&example);
  }
  if (fresh.empty()) {
    return {};
  }

  std::vector<std::string> texts;
  std::vector<nlohmann::json> metadata;
  texts.reserve(fresh.size());
  metadata.reserve(fresh.size());
  for (const auto* example : fresh) {
    texts.push_back(example->natural_query);
    nlohmann::json meta = domain::example_to_json(*example);
    meta.erase("id");
    metadata.push_back(std::move(meta));
  }

  const auto vectors = embedder_.embed_batch(texts);
  if (vectors.size() != texts.size()) {
    throw core::EmbeddingError("embed_batch returned " + std::to_string(vectors.size()) +
                               " vectors for " + std::to_string(texts.size()) + " texts");
  }

  auto ids = index_.add(vectors, metadata);
  for (const auto* example : fresh) {
    sqls_.insert(example->sql);
  }
  return ids;
}

std::vector<domain::Example> ExampleStore::list() const {
  std::vector<domain::Example> out;
  out.reserve(index_.count());
  for (const auto& doc : index_.documents()) {
    if (auto example = example_from_document(doc); example.has_value()) {
      out.push_back(std::move(*example));
    }
  }
  return out;
}

void ExampleStore::load(const std::filesystem::path& dir) {
  index_.load(dir);
  rebuild_sql_set();
}

void ExampleStore::rebuild_sql_set() {
  sqls_.clear();
  for (const auto& doc : index_.documents()) {
    const auto it = doc.metadata.find("sql");
    if (it != doc.metadata.end() && it->is_string()) {
      sqls_.insert(it->get<std::string>());
    }
  }
}

std::string format_examples_for_prompt(const std::vector<ScoredExample>& results) {
  if (results.empty()) {
    return "";
  }

  std::vector<std::string> lines;
  lines.emplace_back("## Similar SQL Examples\n");
  std::size_t n = 1;
  for (const auto& r : results) {
    lines.push_back("### Example " + std::to_string(n++));
    lines.push_back("**Query**: " + r.example.natural_query);
    lines.push_back("**Tables**: " + core::join(r.example.tables, ", "));
    lines.push_back("```sql\n" + r.example.sql + "\n```");
    lines.emplace_back("");
  }
  return core::join(lines, "\n");
}

}  // namespace sqlrag::retrieval
