#pragma once

#include "sqlrag/core/errors.h"
#include "sqlrag/embedding/embedding_provider.h"
#include "sqlrag/execution/sql_executor.h"
#include "sqlrag/llm/llm_client.h"
#include "sqlrag/net/http_client.h"
#include "sqlrag/schema/schema_provider.h"
#include "sqlrag/storage/audit_log.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace sqlrag::testing {

// ScriptedLlmClient answers complete() from a FIFO script and records every
// conversation it was given. An exhausted script is an LlmResponseError.
class ScriptedLlmClient final : public llm::ILlmClient {
 public:
  enum class Failure { kResponse, kUnavailable };

  void push(std::string text) { script_.push_back(Step{std::move(text), std::nullopt}); }
  void push_failure(Failure failure) { script_.push_back(Step{"", failure}); }

  std::string complete(const std::vector<domain::ChatTurn>& turns) override {
    calls_.push_back(turns);
    if (script_.empty()) {
      throw core::LlmResponseError("no scripted response left");
    }
    Step step = script_.front();
    script_.pop_front();
    if (step.failure == Failure::kUnavailable) {
      throw core::LlmUnavailableError("scripted: connection refused");
    }
    if (step.failure == Failure::kResponse) {
      throw core::LlmResponseError("scripted: HTTP 500");
    }
    return step.text;
  }

  [[nodiscard]] std::size_t call_count() const { return calls_.size(); }
  [[nodiscard]] std::size_t remaining() const { return script_.size(); }
  [[nodiscard]] const std::vector<std::vector<domain::ChatTurn>>& calls() const { return calls_; }

  // User-turn text of call i.
  [[nodiscard]] std::string prompt(std::size_t i) const { return calls_.at(i).back().content; }

 private:
  struct Step {
    std::string text;
    std::optional<Failure> failure;
  };

  std::deque<Step> script_;
  std::vector<std::vector<domain::ChatTurn>> calls_;
};

// ScriptedSqlExecutor returns queued outcomes in order; an exhausted script succeeds
// with a one-row result.
class ScriptedSqlExecutor final : public execution::ISqlExecutor {
 public:
  void push_success(domain::ExecutionResult result) {
    script_.push_back(execution::ExecutionOutcome::ok(std::move(result)));
  }
  void push_failure(domain::ExecutionErrorKind kind, std::string message) {
    script_.push_back(execution::ExecutionOutcome::err(
        domain::ExecutionError{.kind = kind, .message = std::move(message)}));
  }

  execution::ExecutionOutcome execute(const std::string& sql,
                                      std::chrono::milliseconds /*timeout*/) override {
    executed_.push_back(sql);
    if (script_.empty()) {
      return execution::ExecutionOutcome::ok(one_row());
    }
    auto outcome = script_.front();
    script_.pop_front();
    return outcome;
  }

  [[nodiscard]] const std::vector<std::string>& executed() const { return executed_; }

  static domain::ExecutionResult one_row() {
    domain::ExecutionResult result;
    result.columns = {"id", "name"};
    result.rows = {{std::string("1"), std::string("widget")}};
    result.row_count = 1;
    return result;
  }

 private:
  std::deque<execution::ExecutionOutcome> script_;
  std::vector<std::string> executed_;
};

// StaticSchemaProvider serves a fixed table list; fail() makes every call throw.
class StaticSchemaProvider final : public schema::ISchemaProvider {
 public:
  StaticSchemaProvider() = default;
  explicit StaticSchemaProvider(std::vector<schema::TableSchema> tables) {
    for (auto& t : tables) {
      order_.push_back(t.name);
      tables_.emplace(t.name, std::move(t));
    }
  }

  void fail(bool failing = true) { failing_ = failing; }

  std::vector<std::string> list_tables() override {
    if (failing_) {
      throw core::SchemaError("database is locked");
    }
    return order_;
  }

  schema::TableSchema describe_table(const std::string& table) override {
    if (failing_) {
      throw core::SchemaError("database is locked");
    }
    auto it = tables_.find(table);
    if (it == tables_.end()) {
      throw core::SchemaError("unknown table '" + table + "'");
    }
    return it->second;
  }

 private:
  std::vector<std::string> order_;
  std::map<std::string, schema::TableSchema> tables_;
  bool failing_{false};
};

// FailingEmbeddingProvider reports the configured dimension and fails every call.
class FailingEmbeddingProvider final : public embedding::IEmbeddingProvider {
 public:
  explicit FailingEmbeddingProvider(std::size_t dim) : dimension_(dim) {}

  vector::Vector embed_text(std::string_view /*text*/) const override {
    throw core::EmbeddingError("embedding service unavailable");
  }
  std::size_t dimension() const override { return dimension_; }
  std::string provider_id() const override { return "failing"; }

 private:
  std::size_t dimension_;
};

// FakeHttpClient replays queued responses and records requests. A queued transport
// failure throws core::TransportError.
class FakeHttpClient final : public net::IHttpClient {
 public:
  void push(long status, std::string body) {
    script_.push_back(Step{net::HttpResponse{.status = status, .body = std::move(body)}, false});
  }
  void push_transport_failure() { script_.push_back(Step{{}, true}); }

  net::HttpResponse post_json(const net::HttpPostRequest& request) override {
    requests_.push_back(request);
    if (script_.empty()) {
      throw core::TransportError("no scripted response left");
    }
    Step step = script_.front();
    script_.pop_front();
    if (step.transport_failure) {
      throw core::TransportError("connection refused");
    }
    return step.response;
  }

  [[nodiscard]] const std::vector<net::HttpPostRequest>& requests() const { return requests_; }

 private:
  struct Step {
    net::HttpResponse response;
    bool transport_failure{false};
  };

  std::deque<Step> script_;
  std::vector<net::HttpPostRequest> requests_;
};

// TempDir creates a unique directory under the system temp directory and removes
// it on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& tag = "sqlrag") {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            (tag + "-" + std::to_string(rd()) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

inline std::size_t count_events(const storage::IAuditLog& log, const std::string& trace_id,
                                const std::string& event_type) {
  std::size_t n = 0;
  for (const auto& e : log.query(trace_id)) {
    if (e.event_type == event_type) {
      ++n;
    }
  }
  return n;
}

}  // namespace sqlrag::testing
