#pragma once

#include "codescope/types.hpp"

#include <string>
#include <vector>

namespace codescope {

struct ChatMessage {
  std::string role;
  std::string content;
};

// Conversational backend. The core never calls it; callers pass it the prompt built
// from a ContextBlock.
class CompletionService {
 public:
  virtual ~CompletionService() = default;

  virtual std::string Complete(const std::string& prompt, const std::vector<ChatMessage>& history) = 0;
};

// The user turn sent to the completion service. Without grounding this is the bare question.
[[nodiscard]] std::string ComposeGroundedPrompt(const std::string& question, const ContextBlock& context);

// history followed by the grounded user turn.
[[nodiscard]] std::vector<ChatMessage> ComposeConversation(const std::vector<ChatMessage>& history,
                                                           const std::string& question,
                                                           const ContextBlock& context);

}  // namespace codescope
