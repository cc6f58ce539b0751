#include "sift_core/types/task.hpp"

namespace sift_core {

std::string priority_to_string(int priority) {
  switch (priority) {
    case static_cast<int>(TaskPriority::High):
      return "HIGH";
    case static_cast<int>(TaskPriority::Medium):
      return "MEDIUM";
    case static_cast<int>(TaskPriority::Low):
      return "LOW";
    default:
      return "UNKNOWN";
  }
}

std::string embedding_text(const std::string& name, const std::optional<std::string>& context) {
  std::string text = name;
  if (context && !context->empty()) {
    text += " Context: " + *context;
  }
  return text;
}

}  // namespace sift_core
