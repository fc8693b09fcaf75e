#include "sqlrag/core/errors.h"
#include "sqlrag/llm/llm_client.h"

#include "support/fakes.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace sqlrag;
using domain::ChatRole;

namespace {

std::string completion(const std::string& content) {
  nlohmann::json message = {{"role", "assistant"}, {"content", content}};
  nlohmann::json body;
  body["choices"] = nlohmann::json::array();
  body["choices"].push_back({{"message", message}});
  return body.dump();
}

llm::LlmConfig test_config() {
  llm::LlmConfig config;
  config.base_url = "http://llm.local/v1";
  config.api_key = "key-123";
  config.model = "qwen-plus";
  config.temperature = 0.1;
  config.max_tokens = 512;
  return config;
}

}  // namespace

TEST_CASE("HttpLlmClient posts chat completions", "[llm][http]") {
  testing::FakeHttpClient http;
  http.push(200, completion("SELECT 1"));
  llm::HttpLlmClient client(http, test_config());

  const auto text =
      client.complete({{ChatRole::kSystem, "be brief"}, {ChatRole::kUser, "查询所有用户"}});
  CHECK(text == "SELECT 1");

  REQUIRE(http.requests().size() == 1);
  const auto& request = http.requests()[0];
  CHECK(request.url == "http://llm.local/v1/chat/completions");
  REQUIRE(request.headers.size() == 1);
  CHECK(request.headers[0].first == "Authorization");
  CHECK(request.headers[0].second == "Bearer key-123");

  const auto body = nlohmann::json::parse(request.json_body);
  CHECK(body.at("model") == "qwen-plus");
  CHECK(body.at("max_tokens") == 512);
  REQUIRE(body.at("messages").size() == 2);
  CHECK(body.at("messages")[0].at("role") == "system");
  CHECK(body.at("messages")[1].at("role") == "user");
  CHECK(body.at("messages")[1].at("content") == "查询所有用户");
}

TEST_CASE("HttpLlmClient maps failures to the two LLM error classes", "[llm][http]") {
  testing::FakeHttpClient http;
  llm::HttpLlmClient client(http, test_config());
  const std::vector<domain::ChatTurn> turns = {{ChatRole::kUser, "hi"}};

  SECTION("no connection is LlmUnavailableError") {
    http.push_transport_failure();
    CHECK_THROWS_AS(client.complete(turns), core::LlmUnavailableError);
  }
  SECTION("error status is LlmResponseError") {
    http.push(429, R"({"error":"rate limited"})");
    CHECK_THROWS_AS(client.complete(turns), core::LlmResponseError);
  }
  SECTION("missing choices is LlmResponseError") {
    http.push(200, R"({"choices":[]})");
    CHECK_THROWS_AS(client.complete(turns), core::LlmResponseError);
  }
  SECTION("non-JSON body is LlmResponseError") {
    http.push(200, "<html>gateway</html>");
    CHECK_THROWS_AS(client.complete(turns), core::LlmResponseError);
  }
}

TEST_CASE("validate_llm_config", "[llm][config]") {
  llm::LlmConfig config;
  CHECK(llm::validate_llm_config(config).empty());

  config.temperature = 2.5;
  CHECK_FALSE(llm::validate_llm_config(config).empty());

  testing::FakeHttpClient http;
  CHECK_THROWS_AS(llm::HttpLlmClient(http, config), std::invalid_argument);
}
