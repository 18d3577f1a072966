#pragma once
#include <string>

#include "nlohmann/json.hpp"

namespace Dockfix
{

// A point in a source file.
// Lines are 1-based, columns are 0-based byte offsets into the line.
// Signed so that malformed coordinates produced by a rule survive until they are validated.
struct Position
{
    int line = 0;
    int column = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Position, line, column)

inline bool operator==(const Position& lhs, const Position& rhs)
{
    return lhs.line == rhs.line && lhs.column == rhs.column;
}
inline bool operator!=(const Position& lhs, const Position& rhs)
{
    return !(lhs == rhs);
}
inline bool operator<(const Position& lhs, const Position& rhs)
{
    return lhs.line < rhs.line || (lhs.line == rhs.line && lhs.column < rhs.column);
}
inline bool operator<=(const Position& lhs, const Position& rhs)
{
    return !(rhs < lhs);
}

// A half-open range [start, end) inside one file
struct Location
{
    std::string file;
    Position start;
    Position end;

    /// A location that refers to the whole file rather than a line
    static Location fileLevel(const std::string& file)
    {
        return Location{file, Position{0, 0}, Position{0, 0}};
    }

    static Location range(const std::string& file, int startLine, int startColumn, int endLine, int endColumn)
    {
        return Location{file, Position{startLine, startColumn}, Position{endLine, endColumn}};
    }

    bool isFileLevel() const
    {
        return start.line <= 0;
    }

    bool isPoint() const
    {
        return start == end;
    }

    bool operator==(const Location& other) const
    {
        return file == other.file && start == other.start && end == other.end;
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Location, file, start, end)

// Replaces the text covered by `location` with `newText`. An empty newText deletes, an empty range inserts.
struct TextEdit
{
    Location location;
    std::string newText;

    bool operator==(const TextEdit& other) const
    {
        return location == other.location && newText == other.newText;
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TextEdit, location, newText)

} // namespace Dockfix
