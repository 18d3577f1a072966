#include "Dockfix/EditApplier.hpp"

#include <algorithm>

namespace Dockfix
{

LineEnding detectLineEnding(std::string_view content)
{
    return content.find("\r\n") != std::string_view::npos ? LineEnding::CRLF : LineEnding::LF;
}

const char* lineEndingText(LineEnding ending)
{
    return ending == LineEnding::CRLF ? "\r\n" : "\n";
}

std::string normalizeLineEndings(const std::string& text, LineEnding ending)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++)
    {
        // The LF of a CRLF pair emits the ending
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            continue;

        if (text[i] == '\n')
            result += lineEndingText(ending);
        else
            result += text[i];
    }
    return result;
}

std::vector<std::string_view> splitLines(std::string_view content, LineEnding ending)
{
    std::string_view separator = lineEndingText(ending);
    std::vector<std::string_view> lines;

    size_t begin = 0;
    while (true)
    {
        auto next = content.find(separator, begin);
        if (next == std::string_view::npos)
        {
            lines.push_back(content.substr(begin));
            break;
        }
        lines.push_back(content.substr(begin, next - begin));
        begin = next + separator.size();
    }
    return lines;
}

size_t lineCount(std::string_view content)
{
    std::string_view separator = lineEndingText(detectLineEnding(content));

    size_t count = 1;
    for (auto pos = content.find(separator); pos != std::string_view::npos; pos = content.find(separator, pos + separator.size()))
        count++;
    return count;
}

bool isEditInRange(std::string_view content, const TextEdit& edit)
{
    auto lines = static_cast<int>(lineCount(content));
    const auto& start = edit.location.start;
    const auto& end = edit.location.end;

    if (start.line < 1 || start.line > lines)
        return false;
    if (end.line < 1 || end.line > lines)
        return false;
    return start <= end;
}

static size_t clampColumn(int column, std::string_view line)
{
    if (column < 0)
        return 0;
    return std::min(static_cast<size_t>(column), line.size());
}

std::string applyEdit(const std::string& content, const TextEdit& edit)
{
    auto ending = detectLineEnding(content);
    std::string_view separator = lineEndingText(ending);
    auto lines = splitLines(content, ending);

    // Locations are 1-based
    int startLine = edit.location.start.line - 1;
    int endLine = edit.location.end.line - 1;
    auto count = static_cast<int>(lines.size());

    if (startLine < 0 || startLine >= count)
        return content;
    if (endLine < 0 || endLine >= count)
        return content;
    if (edit.location.end < edit.location.start)
        return content;

    size_t startColumn = clampColumn(edit.location.start.column, lines[startLine]);
    size_t endColumn = clampColumn(edit.location.end.column, lines[endLine]);

    std::string result;
    result.reserve(content.size() + edit.newText.size());

    for (int i = 0; i < startLine; i++)
    {
        result += lines[i];
        result += separator;
    }

    result += lines[startLine].substr(0, startColumn);
    result += normalizeLineEndings(edit.newText, ending);
    result += lines[endLine].substr(endColumn);

    for (int i = endLine + 1; i < count; i++)
    {
        result += separator;
        result += lines[i];
    }

    return result;
}

} // namespace Dockfix
