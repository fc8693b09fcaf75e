#include "sqlrag/workflow/intent_classifier.h"

#include "sqlrag/core/errors.h"
#include "sqlrag/core/normalization.h"
#include "sqlrag/llm/response_text.h"
#include "sqlrag/workflow/prompts.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>

namespace sqlrag::workflow {

using domain::Intent;

namespace {

constexpr std::array<std::string_view, 12> kGreetings = {
    "hello", "hi",   "hey",  "thanks",   "thank you", "good morning",
    "bye",   "你好", "您好", "谢谢",     "再见",      "who are you"};

constexpr std::array<std::string_view, 12> kDebugWords = {
    "error", "fix", "wrong", "fails", "failed", "broken",
    "debug", "报错", "错误",  "修复",  "不对",   "出错"};

constexpr std::array<std::string_view, 9> kExplainWords = {
    "explain", "what does", "meaning", "mean", "describe", "解释", "含义", "什么意思", "说明"};

constexpr std::array<std::string_view, 14> kQueryWords = {
    "query", "list", "count", "show", "find",  "how many", "total",
    "查询",  "统计", "列出",  "多少", "显示",  "查找",     "找出"};

// Questions about why something happens need the model to tell debugging from querying.
constexpr std::array<std::string_view, 3> kAmbiguousWords = {"why", "为什么", "为何"};

// Whole-word match for ASCII keywords (on the space-joined token stream), substring
// match for keywords containing UTF-8 text.
bool contains_keyword(const std::string& padded_tokens, const std::string_view raw,
                      const std::string_view keyword) {
  const bool ascii = std::all_of(keyword.begin(), keyword.end(),
                                 [](char ch) { return static_cast<unsigned char>(ch) < 0x80; });
  if (!ascii) {
    return raw.find(keyword) != std::string_view::npos;
  }
  return padded_tokens.find(" " + std::string(keyword) + " ") != std::string::npos;
}

template <std::size_t N>
bool contains_any(const std::string& padded_tokens, const std::string_view raw,
                  const std::array<std::string_view, N>& keywords) {
  return std::any_of(keywords.begin(), keywords.end(), [&](std::string_view kw) {
    return contains_keyword(padded_tokens, raw, kw);
  });
}

}  // namespace

std::string_view to_string(const ClassificationError error) {
  switch (error) {
    case ClassificationError::kEmptyResponse:
      return "empty_response";
    case ClassificationError::kMalformedResponse:
      return "malformed_response";
    case ClassificationError::kUnknownIntent:
      return "unknown_intent";
  }
  return "unknown";
}

std::optional<Intent> match_intent_keywords(const std::string_view input) {
  const std::string trimmed = core::trim(input);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  const std::string padded = " " + core::join(core::tokenize_text(trimmed, 1), " ") + " ";

  // A greeting is only conclusive when it is the whole message.
  std::string bare = core::normalize_ascii_lower(trimmed);
  while (!bare.empty() && (bare.back() == '!' || bare.back() == '.' || bare.back() == '?')) {
    bare.pop_back();
  }
  if (std::find(kGreetings.begin(), kGreetings.end(), core::trim(bare)) != kGreetings.end()) {
    return Intent::kChat;
  }

  const bool has_sql = contains_keyword(padded, trimmed, "select");
  if (has_sql && contains_any(padded, trimmed, kDebugWords)) {
    return Intent::kDebug;
  }
  if (has_sql && contains_any(padded, trimmed, kExplainWords)) {
    return Intent::kSqlToText;
  }
  if (contains_any(padded, trimmed, kAmbiguousWords)) {
    return std::nullopt;
  }
  if (!has_sql && contains_any(padded, trimmed, kQueryWords)) {
    return Intent::kTextToSql;
  }
  return std::nullopt;
}

core::Result<IntentDecision, ClassificationError> parse_intent_response(const std::string_view text) {
  using ParseResult = core::Result<IntentDecision, ClassificationError>;

  const std::string payload = llm::extract_json_payload(text);
  if (payload.empty()) {
    return ParseResult::err(ClassificationError::kEmptyResponse);
  }
  const auto parsed = nlohmann::json::parse(payload, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("intent") ||
      !parsed.at("intent").is_string()) {
    return ParseResult::err(ClassificationError::kMalformedResponse);
  }

  const auto intent = domain::parse_intent(parsed.at("intent").get<std::string>());
  if (!intent.has_value()) {
    return ParseResult::err(ClassificationError::kUnknownIntent);
  }

  IntentDecision decision;
  decision.intent = *intent;
  if (parsed.contains("confidence") && parsed.at("confidence").is_number()) {
    decision.confidence = std::clamp(parsed.at("confidence").get<double>(), 0.0, 1.0);
  }
  if (parsed.contains("reasoning") && parsed.at("reasoning").is_string()) {
    decision.reasoning = parsed.at("reasoning").get<std::string>();
  }
  return ParseResult::ok(std::move(decision));
}

IntentClassifier::IntentClassifier(llm::ILlmClient& llm, IntentClassifierConfig config)
    : llm_(llm), config_(config) {}

IntentDecision IntentClassifier::classify(const std::string& user_input) {
  if (const auto fast = match_intent_keywords(user_input); fast.has_value()) {
    return IntentDecision{.intent = *fast,
                          .confidence = config_.fast_path_confidence,
                          .reasoning = "keyword match",
                          .fast_path = true};
  }

  std::string answer;
  try {
    answer = llm_.complete({{domain::ChatRole::kUser, intent_classifier_prompt(user_input)}});
  } catch (const core::LlmResponseError& e) {
    return IntentDecision{.intent = config_.default_intent,
                          .confidence = config_.fallback_confidence,
                          .reasoning = std::string("classifier unavailable: ") + e.what(),
                          .fast_path = false};
  }

  auto parsed = parse_intent_response(answer);
  if (!parsed.has_value()) {
    return IntentDecision{.intent = config_.default_intent,
                          .confidence = config_.fallback_confidence,
                          .reasoning = "classifier answer rejected: " +
                                       std::string(to_string(parsed.error())),
                          .fast_path = false};
  }
  return parsed.value();
}

}  // namespace sqlrag::workflow
