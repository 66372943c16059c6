#include "docmind_core/types/conversation.hpp"

#include <stdexcept>

namespace docmind_core {

std::string to_string(ConversationRole role) {
  switch (role) {
    case ConversationRole::Assistant:
      return "assistant";
    default:
      return "user";
  }
}

ConversationRole conversation_role_from_string(const std::string& str) {
  if (str == "user")
    return ConversationRole::User;
  if (str == "assistant")
    return ConversationRole::Assistant;
  throw std::invalid_argument("Unknown conversation role: " + str);
}

}  // namespace docmind_core
