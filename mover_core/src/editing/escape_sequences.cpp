#include "ResourceMover/editing/escape_sequences.hpp"

#include "ResourceMover/core/types.hpp"
#include <regex>

namespace ResourceMover::editing {

std::string protectEscapeSequences(const std::string& text) {
  static const std::regex escapeSequencePattern(R"(&([\w#]+;))");
  return std::regex_replace(text, escapeSequencePattern,
                            std::string(kEscapeSequenceMarker) + "$1");
}

std::string restoreEscapeSequences(const std::string& text) {
  std::string result;
  result.reserve(text.size());

  usize pos = 0;
  while (true) {
    const usize found = text.find(kEscapeSequenceMarker, pos);
    if (found == std::string::npos) {
      result.append(text, pos, std::string::npos);
      break;
    }
    result.append(text, pos, found - pos);
    result += '&';
    pos = found + kEscapeSequenceMarker.size();
  }
  return result;
}

} // namespace ResourceMover::editing
