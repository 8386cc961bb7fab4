#pragma once

/**
 * @file escape_sequences.hpp
 * @brief Keeps character references (&apos;, &#8230;) spelled as written
 *
 * XML treats a character reference and the character it names as the same
 * text, so a parser is free to hand back the decoded character. To keep
 * rewritten files byte-for-byte identical outside of the edited units, the
 * leading '&' of every reference is swapped for a marker string before
 * parsing and swapped back after serializing.
 */

#include <string>
#include <string_view>

namespace ResourceMover::editing {

inline constexpr std::string_view kEscapeSequenceMarker =
    "RESOURCE_MOVER_ESCAPE_SEQUENCE_START_MARKER";

/**
 * @brief Replace the '&' of each "&name;" / "&#123;" sequence with the marker
 */
[[nodiscard]] std::string protectEscapeSequences(const std::string& text);

/**
 * @brief Turn every marker back into '&'
 */
[[nodiscard]] std::string restoreEscapeSequences(const std::string& text);

} // namespace ResourceMover::editing
