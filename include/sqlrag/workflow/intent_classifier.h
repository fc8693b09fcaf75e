#pragma once

#include "sqlrag/core/result.h"
#include "sqlrag/domain/workflow_state.h"
#include "sqlrag/llm/llm_client.h"

#include <optional>
#include <string>
#include <string_view>

namespace sqlrag::workflow {

enum class ClassificationError {
  kEmptyResponse,
  kMalformedResponse,
  kUnknownIntent,
};

[[nodiscard]] std::string_view to_string(ClassificationError error);

struct IntentDecision {
  domain::Intent intent{domain::Intent::kChat};  // NOLINT(readability-identifier-naming)
  double confidence{0.0};                        // NOLINT(readability-identifier-naming)
  std::string reasoning;                         // NOLINT(readability-identifier-naming)
  bool fast_path{false};                         // NOLINT(readability-identifier-naming)
};

struct IntentClassifierConfig {
  domain::Intent default_intent{domain::Intent::kChat};  // NOLINT(readability-identifier-naming)
  double fallback_confidence{0.5};                       // NOLINT(readability-identifier-naming)
  double fast_path_confidence{0.9};                      // NOLINT(readability-identifier-naming)
};

// Keyword rules; nullopt when the input is not clearly one intent.
[[nodiscard]] std::optional<domain::Intent> match_intent_keywords(std::string_view input);

// Parses the classifier's JSON answer (optionally inside a ```json fence).
// confidence is clamped to [0, 1] and defaults to 0 when absent.
[[nodiscard]] core::Result<IntentDecision, ClassificationError> parse_intent_response(
    std::string_view text);

// IntentClassifier runs the keyword fast path first and asks the LLM only when it is
// inconclusive. Unusable LLM answers map to config.default_intent with
// fallback_confidence. core::LlmUnavailableError propagates.
class IntentClassifier {
 public:
  explicit IntentClassifier(llm::ILlmClient& llm, IntentClassifierConfig config = {});

  [[nodiscard]] IntentDecision classify(const std::string& user_input);

 private:
  llm::ILlmClient& llm_;
  IntentClassifierConfig config_;
};

}  // namespace sqlrag::workflow
