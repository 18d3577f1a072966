#pragma once
#include <optional>
#include <vector>

#include "Dockfix/Location.hpp"

namespace Dockfix
{

/// Whether two ranges overlap. Range A lies fully before B only if A ends at or before B starts.
bool rangesOverlap(const Location& a, const Location& b);

/// Whether two edits in one file cannot both be applied: their ranges overlap, or both insert at the same position
bool rangesConflict(const Location& a, const Location& b);

/// Two edits overlap if their ranges overlap. Edits in different files never overlap.
bool editsOverlap(const TextEdit& a, const TextEdit& b);

/// Whether `a` starts before `b` in document order
bool editStartsBefore(const TextEdit& a, const TextEdit& b);

// Movement of the text following an applied edit.
// Both positions are in the coordinates of the content the edit was applied to.
struct EditShift
{
    /// End of the replaced range. Positions at or after it move.
    Position oldEnd;
    /// Where oldEnd lands once the replacement is in place
    Position newEnd;
};

/// The shift produced by applying `edit` as given, or nothing if no later position moves
std::optional<EditShift> shiftForEdit(const TextEdit& edit);

/// Carries a position through a sequence of shifts, in the order they were applied
Position adjustPosition(Position position, const std::vector<EditShift>& shifts);

/// Carries both ends of `edit` through `shifts`
TextEdit adjustEdit(const TextEdit& edit, const std::vector<EditShift>& shifts);

} // namespace Dockfix
