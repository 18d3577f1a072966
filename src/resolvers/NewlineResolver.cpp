#include "Dockfix/NewlineResolver.hpp"
#include "Dockfix/EditApplier.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace Dockfix
{

static std::string_view trimStart(std::string_view str)
{
    size_t begin = 0;
    while (begin < str.size() && std::isspace(static_cast<unsigned char>(str[begin])))
        begin++;
    return str.substr(begin);
}

static std::string_view trimEnd(std::string_view str)
{
    size_t end = str.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(str[end - 1])))
        end--;
    return str.substr(0, end);
}

static std::string toLower(std::string_view str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c)
        {
            return static_cast<char>(std::tolower(c));
        });
    return result;
}

static bool isBlankOrComment(std::string_view line)
{
    auto trimmed = trimStart(line);
    return trimmed.empty() || trimmed[0] == '#';
}

/// The escape character set by a `# escape=` parser directive, if the file starts with one
static char detectEscapeCharacter(const std::vector<std::string_view>& lines)
{
    for (auto line : lines)
    {
        auto trimmed = trimStart(line);
        if (trimmed.empty() || trimmed[0] != '#')
            break;

        auto directive = trimStart(trimmed.substr(1));
        auto equals = directive.find('=');
        if (equals == std::string_view::npos)
            break;

        if (toLower(trimEnd(directive.substr(0, equals))) != "escape")
            continue;

        auto value = trimEnd(trimStart(directive.substr(equals + 1)));
        if (value == "`")
            return '`';
        break;
    }
    return '\\';
}

static bool endsWithEscape(std::string_view line, char escape)
{
    auto trimmed = trimEnd(line);
    return !trimmed.empty() && trimmed.back() == escape;
}

struct HeredocMarker
{
    std::string word;
    /// <<- strips leading tabs from the body and the terminator
    bool stripTabs = false;
};

static std::vector<HeredocMarker> findHeredocs(std::string_view text)
{
    std::vector<HeredocMarker> markers;

    for (size_t pos = text.find("<<"); pos != std::string_view::npos; pos = text.find("<<", pos + 2))
    {
        size_t i = pos + 2;
        // <<< is a here-string
        if (i < text.size() && text[i] == '<')
        {
            pos = i;
            continue;
        }

        HeredocMarker marker;
        if (i < text.size() && text[i] == '-')
        {
            marker.stripTabs = true;
            i++;
        }

        char quote = 0;
        if (i < text.size() && (text[i] == '"' || text[i] == '\''))
            quote = text[i++];

        size_t wordBegin = i;
        while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_'))
            i++;
        if (i == wordBegin)
            continue;
        if (quote && (i >= text.size() || text[i] != quote))
            continue;

        marker.word = std::string(text.substr(wordBegin, i - wordBegin));
        markers.push_back(std::move(marker));
    }

    return markers;
}

static bool supportsHeredocs(const std::string& keyword)
{
    return keyword == "run" || keyword == "copy" || keyword == "add";
}

std::vector<InstructionSpan> scanInstructions(std::string_view content)
{
    auto lines = splitLines(content, detectLineEnding(content));
    const char escape = detectEscapeCharacter(lines);
    const size_t count = lines.size();

    std::vector<InstructionSpan> spans;
    // 0-based index of the first comment line since the previous instruction
    std::optional<size_t> commentStart;

    size_t i = 0;
    while (i < count)
    {
        auto trimmed = trimStart(lines[i]);
        if (trimmed.empty())
        {
            i++;
            continue;
        }
        if (trimmed[0] == '#')
        {
            if (!commentStart)
                commentStart = i;
            i++;
            continue;
        }

        InstructionSpan span;
        span.instructionLine = static_cast<int>(i) + 1;
        span.startLine = static_cast<int>(commentStart.value_or(i)) + 1;
        commentStart = std::nullopt;

        auto keywordEnd = std::find_if(trimmed.begin(), trimmed.end(),
            [](char c)
            {
                return std::isspace(static_cast<unsigned char>(c));
            });
        span.keyword = toLower(trimmed.substr(0, static_cast<size_t>(keywordEnd - trimmed.begin())));

        // Continuations may contain blank and comment lines; they do not end the instruction
        std::string text(lines[i]);
        size_t end = i;
        bool continued = endsWithEscape(lines[i], escape);
        for (size_t next = i + 1; continued && next < count; next++)
        {
            if (isBlankOrComment(lines[next]))
                continue;

            text += '\n';
            text += lines[next];
            end = next;
            continued = endsWithEscape(lines[next], escape);
        }

        if (supportsHeredocs(span.keyword))
        {
            for (const auto& marker : findHeredocs(text))
            {
                size_t terminator = end + 1;
                for (; terminator < count; terminator++)
                {
                    auto body = lines[terminator];
                    if (marker.stripTabs)
                        body.remove_prefix(std::min(body.find_first_not_of('\t'), body.size()));
                    if (trimEnd(body) == marker.word)
                        break;
                }
                // An unterminated heredoc runs to the end of the file
                end = std::min(terminator, count - 1);
                if (terminator >= count)
                    break;
            }
        }

        span.endLine = static_cast<int>(end) + 1;
        spans.push_back(std::move(span));
        i = end + 1;
    }

    return spans;
}

ResolveResult NewlineResolver::resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const
{
    const auto* data = std::get_if<NewlineResolveData>(&fix.resolverData);
    if (!data)
        return ResolveError{"fix does not carry newline resolver data"};

    if (cancellationToken && cancellationToken->requested())
        return ResolveError{"resolution cancelled"};

    auto spans = scanInstructions(context.content);
    std::vector<TextEdit> edits;

    for (size_t i = 1; i < spans.size(); i++)
    {
        const auto& previous = spans[i - 1];
        const auto& current = spans[i];
        int gap = current.startLine - previous.endLine - 1;

        int wanted = 0;
        switch (data->mode)
        {
        case NewlineMode::Always:
            if (gap >= 1)
                continue;
            wanted = 1;
            break;
        case NewlineMode::Never:
            wanted = 0;
            break;
        case NewlineMode::Grouped:
            wanted = previous.keyword == current.keyword ? 0 : 1;
            break;
        }

        if (gap == wanted)
            continue;

        int firstGapLine = previous.endLine + 1;
        if (gap < wanted)
        {
            edits.push_back(TextEdit{Location::range(context.filePath, firstGapLine, 0, firstGapLine, 0), std::string(static_cast<size_t>(wanted - gap), '\n')});
        }
        else
        {
            // Only surplus blank lines go, so a wanted separator survives
            edits.push_back(TextEdit{Location::range(context.filePath, firstGapLine, 0, firstGapLine + gap - wanted, 0), ""});
        }
    }

    return edits;
}

} // namespace Dockfix
