#include "sqlrag/core/errors.h"
#include "sqlrag/workflow/intent_classifier.h"

#include "support/fakes.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace sqlrag;
using domain::Intent;
using workflow::match_intent_keywords;

TEST_CASE("Keyword rules recognise clear intents", "[workflow][intent]") {
  CHECK(match_intent_keywords("hello") == std::optional{Intent::kChat});
  CHECK(match_intent_keywords("你好!") == std::optional{Intent::kChat});
  CHECK(match_intent_keywords("查询所有价格大于100的商品") == std::optional{Intent::kTextToSql});
  CHECK(match_intent_keywords("how many orders were placed last month") ==
        std::optional{Intent::kTextToSql});
  CHECK(match_intent_keywords("explain SELECT * FROM users") == std::optional{Intent::kSqlToText});
  CHECK(match_intent_keywords("解释一下 SELECT name FROM products") ==
        std::optional{Intent::kSqlToText});
  CHECK(match_intent_keywords("this fails: SELECT * FROM user") == std::optional{Intent::kDebug});
  CHECK(match_intent_keywords("SELECT * FROM order 报错了") == std::optional{Intent::kDebug});
}

TEST_CASE("Keyword rules stay inconclusive on unclear input", "[workflow][intent]") {
  CHECK_FALSE(match_intent_keywords("").has_value());
  CHECK_FALSE(match_intent_keywords("hello, how many users signed up today?") ==
              std::optional{Intent::kChat});
  CHECK_FALSE(match_intent_keywords("why are sales dropping").has_value());
  CHECK_FALSE(match_intent_keywords("tell me something interesting").has_value());
  // Whole words only: "shows" is not "show", "listing" is not "list".
  CHECK_FALSE(match_intent_keywords("the listing shows nothing").has_value());
}

TEST_CASE("parse_intent_response", "[workflow][intent]") {
  SECTION("fenced JSON with clamped confidence") {
    const auto parsed = workflow::parse_intent_response(
        "```json\n{\"intent\": \"debug\", \"confidence\": 1.7, \"reasoning\": \"has error\"}\n```");
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().intent == Intent::kDebug);
    CHECK_THAT(parsed.value().confidence, Catch::Matchers::WithinAbs(1.0, 1e-12));
    CHECK(parsed.value().reasoning == "has error");
  }
  SECTION("missing confidence defaults to 0") {
    const auto parsed = workflow::parse_intent_response(R"({"intent":"text_to_sql"})");
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().confidence == 0.0);
  }
  SECTION("errors") {
    CHECK(workflow::parse_intent_response("   ").error() ==
          workflow::ClassificationError::kEmptyResponse);
    CHECK(workflow::parse_intent_response("I think it is chat").error() ==
          workflow::ClassificationError::kMalformedResponse);
    CHECK(workflow::parse_intent_response(R"({"confidence":0.9})").error() ==
          workflow::ClassificationError::kMalformedResponse);
    CHECK(workflow::parse_intent_response(R"({"intent":"smalltalk"})").error() ==
          workflow::ClassificationError::kUnknownIntent);
  }
}

TEST_CASE("IntentClassifier fast path does not call the LLM", "[workflow][intent]") {
  testing::ScriptedLlmClient llm;
  workflow::IntentClassifier classifier(llm);

  const auto decision = classifier.classify("统计每个分类的商品数量");
  CHECK(decision.intent == Intent::kTextToSql);
  CHECK(decision.fast_path);
  CHECK_THAT(decision.confidence, Catch::Matchers::WithinAbs(0.9, 1e-12));
  CHECK(llm.call_count() == 0);
}

TEST_CASE("IntentClassifier falls back to the LLM", "[workflow][intent]") {
  testing::ScriptedLlmClient llm;
  workflow::IntentClassifier classifier(llm);

  SECTION("usable answer") {
    llm.push(R"({"intent":"text_to_sql","confidence":0.75,"reasoning":"asks for data"})");
    const auto decision = classifier.classify("why are sales dropping");
    CHECK(decision.intent == Intent::kTextToSql);
    CHECK_FALSE(decision.fast_path);
    CHECK_THAT(decision.confidence, Catch::Matchers::WithinAbs(0.75, 1e-12));
    REQUIRE(llm.call_count() == 1);
    CHECK(llm.prompt(0).find("why are sales dropping") != std::string::npos);
  }
  SECTION("malformed answer maps to the default intent") {
    llm.push("definitely chat");
    const auto decision = classifier.classify("tell me something interesting");
    CHECK(decision.intent == Intent::kChat);
    CHECK_THAT(decision.confidence, Catch::Matchers::WithinAbs(0.5, 1e-12));
  }
  SECTION("model error maps to the default intent") {
    llm.push_failure(testing::ScriptedLlmClient::Failure::kResponse);
    const auto decision = classifier.classify("tell me something interesting");
    CHECK(decision.intent == Intent::kChat);
  }
  SECTION("unreachable model propagates") {
    llm.push_failure(testing::ScriptedLlmClient::Failure::kUnavailable);
    CHECK_THROWS_AS(classifier.classify("tell me something interesting"),
                    core::LlmUnavailableError);
  }
}

TEST_CASE("IntentClassifier honours a configured default", "[workflow][intent]") {
  testing::ScriptedLlmClient llm;
  llm.push("???");
  workflow::IntentClassifier classifier(
      llm, workflow::IntentClassifierConfig{.default_intent = Intent::kTextToSql,
                                            .fallback_confidence = 0.3,
                                            .fast_path_confidence = 0.9});
  const auto decision = classifier.classify("tell me something interesting");
  CHECK(decision.intent == Intent::kTextToSql);
  CHECK_THAT(decision.confidence, Catch::Matchers::WithinAbs(0.3, 1e-12));
}
