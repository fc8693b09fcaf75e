#pragma once

#include "sqlrag/domain/chat.h"
#include "sqlrag/net/http_client.h"

#include <string>
#include <vector>

namespace sqlrag::llm {

// ILlmClient completes one chat conversation and returns the assistant text.
// Throws core::LlmUnavailableError when the model cannot be reached at all and
// core::LlmResponseError when it answered with something unusable.
class ILlmClient {
 public:
  virtual ~ILlmClient() = default;

  [[nodiscard]] virtual std::string complete(const std::vector<domain::ChatTurn>& turns) = 0;
};

struct LlmConfig {
  std::string base_url{"https://api.openai.com/v1"};  // NOLINT(readability-identifier-naming)
  std::string api_key;                                // NOLINT(readability-identifier-naming)
  std::string model{"gpt-4"};                         // NOLINT(readability-identifier-naming)
  double temperature{0.7};                            // NOLINT(readability-identifier-naming)
  int max_tokens{4096};                               // NOLINT(readability-identifier-naming)
  long timeout_ms{60000};                             // NOLINT(readability-identifier-naming)
};

// Returns "" when the config is usable, otherwise a human-readable reason.
[[nodiscard]] std::string validate_llm_config(const LlmConfig& config);

// HttpLlmClient speaks the OpenAI-compatible POST {base_url}/chat/completions API.
class HttpLlmClient final : public ILlmClient {
 public:
  // Throws std::invalid_argument when validate_llm_config rejects config.
  HttpLlmClient(net::IHttpClient& http, LlmConfig config);

  [[nodiscard]] std::string complete(const std::vector<domain::ChatTurn>& turns) override;

  [[nodiscard]] const LlmConfig& config() const { return config_; }

 private:
  net::IHttpClient& http_;
  LlmConfig config_;
};

}  // namespace sqlrag::llm
