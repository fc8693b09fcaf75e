#pragma once

#include <string>
#include <string_view>

namespace sqlrag::domain {

enum class ChatRole {
  kSystem,
  kUser,
  kAssistant,
};

// Wire names used by OpenAI-compatible chat endpoints.
[[nodiscard]] inline std::string_view to_string(const ChatRole role) {
  switch (role) {
    case ChatRole::kSystem:
      return "system";
    case ChatRole::kUser:
      return "user";
    case ChatRole::kAssistant:
      return "assistant";
  }
  return "user";
}

struct ChatTurn {
  ChatRole role{ChatRole::kUser};  // NOLINT(readability-identifier-naming)
  std::string content;             // NOLINT(readability-identifier-naming)
};

}  // namespace sqlrag::domain
