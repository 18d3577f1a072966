#include "Dockfix/Conflict.hpp"

namespace Dockfix
{

bool rangesOverlap(const Location& a, const Location& b)
{
    // [a.start, a.end) and [b.start, b.end) are disjoint only if one ends before the other starts
    if (a.end <= b.start)
        return false;
    if (b.end <= a.start)
        return false;
    return true;
}

bool rangesConflict(const Location& a, const Location& b)
{
    // Insertions at one point have no defined order
    if (a.isPoint() && b.isPoint())
        return a.start == b.start;
    return rangesOverlap(a, b);
}

bool editsOverlap(const TextEdit& a, const TextEdit& b)
{
    if (a.location.file != b.location.file)
        return false;
    return rangesOverlap(a.location, b.location);
}

bool editStartsBefore(const TextEdit& a, const TextEdit& b)
{
    return a.location.start < b.location.start;
}

std::optional<EditShift> shiftForEdit(const TextEdit& edit)
{
    const auto& start = edit.location.start;
    const auto& text = edit.newText;

    int newlines = 0;
    size_t lastLineBegin = 0;
    for (size_t i = 0; i < text.size(); i++)
    {
        if (text[i] == '\n')
        {
            newlines++;
            lastLineBegin = i + 1;
        }
    }

    Position newEnd;
    if (newlines == 0)
        newEnd = Position{start.line, start.column + static_cast<int>(text.size())};
    else
        newEnd = Position{start.line + newlines, static_cast<int>(text.size() - lastLineBegin)};

    if (newEnd == edit.location.end)
        return std::nullopt;

    return EditShift{edit.location.end, newEnd};
}

Position adjustPosition(Position position, const std::vector<EditShift>& shifts)
{
    for (const auto& shift : shifts)
    {
        if (position < shift.oldEnd)
            continue;

        if (position.line == shift.oldEnd.line)
            position = Position{shift.newEnd.line, shift.newEnd.column + (position.column - shift.oldEnd.column)};
        else
            position.line += shift.newEnd.line - shift.oldEnd.line;
    }
    return position;
}

TextEdit adjustEdit(const TextEdit& edit, const std::vector<EditShift>& shifts)
{
    if (shifts.empty())
        return edit;

    TextEdit adjusted = edit;
    adjusted.location.start = adjustPosition(edit.location.start, shifts);
    adjusted.location.end = adjustPosition(edit.location.end, shifts);
    return adjusted;
}

} // namespace Dockfix
