#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "Dockfix/Location.hpp"

namespace Dockfix
{

enum struct LineEnding
{
    LF,
    CRLF,
};

/// CRLF if the content contains any CRLF sequence, LF otherwise
LineEnding detectLineEnding(std::string_view content);

const char* lineEndingText(LineEnding ending);

/// Rewrites every newline in `text` (LF or CRLF) to `ending`
std::string normalizeLineEndings(const std::string& text, LineEnding ending);

/// Splits content along `ending`. A trailing line ending yields a final empty line.
std::vector<std::string_view> splitLines(std::string_view content, LineEnding ending);

/// Number of lines applyEdit addresses in `content`
size_t lineCount(std::string_view content);

/// Whether both the start and the end line of `edit` fall inside [1, lineCount(content)]
bool isEditInRange(std::string_view content, const TextEdit& edit);

// Replaces the range covered by `edit` with its text and returns the new content.
// The replacement's newlines are rewritten to the content's line ending.
// Columns outside a line are clamped to it. An edit whose start or end line lies outside
// the content leaves it unchanged.
std::string applyEdit(const std::string& content, const TextEdit& edit);

} // namespace Dockfix
