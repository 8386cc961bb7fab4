#include "ResourceMover/runner/progress_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ostream>

namespace ResourceMover::runner {

namespace {

const char* toneColor(MessageTone tone) {
  switch (tone) {
  case MessageTone::Success:
    return "\033[32m";
  case MessageTone::Notice:
    return "\033[33m";
  case MessageTone::Failure:
    return "\033[31m";
  default:
    return "";
  }
}

std::string repeat(const std::string& piece, usize count) {
  std::string out;
  out.reserve(piece.size() * count);
  for (usize i = 0; i < count; ++i) {
    out += piece;
  }
  return out;
}

// Pads a frame edge of `visibleLength` columns out to the frame width
std::string frameLine(const std::string& start, usize visibleLength) {
  const usize padding = visibleLength < kFrameWidth ? kFrameWidth - visibleLength : 0;
  return start + repeat("━", padding);
}

} // namespace

ConsoleProgressLogger::ConsoleProgressLogger(std::ostream& out, bool useColors)
    : m_out(out), m_useColors(useColors) {}

void ConsoleProgressLogger::log(u32 depth, const std::string& message, MessageTone tone) {
  m_out << repeat("┃ ", depth);
  if (m_useColors && tone != MessageTone::Plain) {
    m_out << toneColor(tone) << message << "\033[0m";
  } else {
    m_out << message;
  }
  m_out << '\n';
  m_out.flush();
}

void logFrame(IProgressLogger& logger, u32 depth, const std::string& title,
              const std::function<void(u32 frameDepth)>& body) {
  // "┏━(" and ")" are four columns around the title
  logger.log(depth, frameLine("┏━(" + title + ")", title.size() + 4));

  const auto start = std::chrono::steady_clock::now();
  body(depth + 1);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  const f64 seconds = std::chrono::duration<f64>(elapsed).count();
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.3fs", seconds);
  const std::string duration = buffer;

  logger.log(depth, frameLine("┗━(" + duration + ")", duration.size() + 4));
}

} // namespace ResourceMover::runner
