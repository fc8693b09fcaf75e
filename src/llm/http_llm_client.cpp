#include "sqlrag/llm/llm_client.h"

#include "sqlrag/core/errors.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace sqlrag::llm {

std::string validate_llm_config(const LlmConfig& config) {
  if (config.base_url.empty()) {
    return "--llm-url must not be empty";
  }
  if (config.model.empty()) {
    return "--llm-model must not be empty";
  }
  if (config.temperature < 0.0 || config.temperature > 2.0) {
    return "temperature must be within [0, 2]";
  }
  if (config.max_tokens <= 0) {
    return "max tokens must be positive";
  }
  if (config.timeout_ms <= 0) {
    return "LLM timeout must be positive";
  }
  return "";
}

HttpLlmClient::HttpLlmClient(net::IHttpClient& http, LlmConfig config)
    : http_(http), config_(std::move(config)) {
  if (const auto problem = validate_llm_config(config_); !problem.empty()) {
    throw std::invalid_argument("HttpLlmClient: " + problem);
  }
}

std::string HttpLlmClient::complete(const std::vector<domain::ChatTurn>& turns) {
  nlohmann::json messages = nlohmann::json::array();
  for (const auto& turn : turns) {
    messages.push_back({{"role", std::string(domain::to_string(turn.role))},
                        {"content", turn.content}});
  }

  nlohmann::json body;
  body["model"] = config_.model;
  body["messages"] = std::move(messages);
  body["temperature"] = config_.temperature;
  body["max_tokens"] = config_.max_tokens;

  net::HttpPostRequest request;
  request.url = net::join_url(config_.base_url, "chat/completions");
  request.json_body = body.dump();
  request.timeout_ms = config_.timeout_ms;
  if (!config_.api_key.empty()) {
    request.headers.emplace_back("Authorization", "Bearer " + config_.api_key);
  }

  net::HttpResponse response;
  try {
    response = http_.post_json(request);
  } catch (const core::TransportError& e) {
    throw core::LlmUnavailableError(std::string("LLM endpoint unreachable: ") + e.what());
  }

  if (response.status < 200 || response.status >= 300) {
    throw core::LlmResponseError("LLM endpoint returned HTTP " + std::to_string(response.status));
  }

  const auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (parsed.is_discarded() || !parsed.contains("choices") || !parsed.at("choices").is_array() ||
      parsed.at("choices").empty()) {
    throw core::LlmResponseError("LLM response has no choices");
  }
  const auto& choice = parsed.at("choices").at(0);
  if (!choice.contains("message") || !choice.at("message").is_object() ||
      !choice.at("message").contains("content") ||
      !choice.at("message").at("content").is_string()) {
    throw core::LlmResponseError("LLM response choice has no message content");
  }
  return choice.at("message").at("content").get<std::string>();
}

}  // namespace sqlrag::llm
