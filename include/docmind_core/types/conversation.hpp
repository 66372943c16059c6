#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace docmind_core {

enum class ConversationRole { User, Assistant };

std::string to_string(ConversationRole role);
ConversationRole conversation_role_from_string(const std::string& str);

struct ConversationTurn {
  ConversationRole role = ConversationRole::User;
  std::string content;
  std::chrono::system_clock::time_point timestamp;
  std::optional<std::string> query_id;
};

}  // namespace docmind_core
