#include "codescope/completion.hpp"

namespace codescope {

std::string ComposeGroundedPrompt(const std::string& question, const ContextBlock& context) {
  if (!context.grounded || context.text.empty()) {
    return question;
  }
  std::string prompt = "Question: ";
  prompt.append(question);
  prompt.append("\n\nRelevant code from the codebase:\n");
  prompt.append(context.text);
  prompt.append("\n\nPlease answer the question using the code context above when relevant.");
  return prompt;
}

std::vector<ChatMessage> ComposeConversation(const std::vector<ChatMessage>& history,
                                             const std::string& question,
                                             const ContextBlock& context) {
  std::vector<ChatMessage> out = history;
  out.push_back(ChatMessage{"user", ComposeGroundedPrompt(question, context)});
  return out;
}

}  // namespace codescope
