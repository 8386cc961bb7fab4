#pragma once

/**
 * @file progress_logger.hpp
 * @brief Round-by-round progress output of the runners
 *
 * Runners receive an IProgressLogger and pass an explicit nesting depth
 * down with every message; logFrame() draws a titled, timed frame around
 * a block of messages one level deeper:
 *
 *   ┏━(Round #1)━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━
 *   ┃ Moved 3 resource(s). ...
 *   ┗━(0.042s)━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━
 */

#include "ResourceMover/core/types.hpp"
#include <functional>
#include <iosfwd>
#include <string>

namespace ResourceMover::runner {

enum class MessageTone { Plain, Success, Notice, Failure };

class IProgressLogger {
public:
  virtual ~IProgressLogger() = default;

  virtual void log(u32 depth, const std::string& message, MessageTone tone) = 0;

  void log(u32 depth, const std::string& message) { log(depth, message, MessageTone::Plain); }
};

/**
 * @brief Writes frames with box-drawing characters and ANSI colors
 */
class ConsoleProgressLogger : public IProgressLogger {
public:
  ConsoleProgressLogger(std::ostream& out, bool useColors);

  using IProgressLogger::log;
  void log(u32 depth, const std::string& message, MessageTone tone) override;

private:
  std::ostream& m_out;
  bool m_useColors;
};

inline constexpr usize kFrameWidth = 120;

/**
 * @brief Run @p body inside a frame titled @p title
 *
 * The header and footer are logged at @p depth; @p body receives the depth
 * for its own messages. The footer shows the time spent in @p body.
 */
void logFrame(IProgressLogger& logger, u32 depth, const std::string& title,
              const std::function<void(u32 frameDepth)>& body);

} // namespace ResourceMover::runner
