#include "doctest.h"
#include "Fixture.h"
#include "Dockfix/Conflict.hpp"

using namespace Dockfix;
using Dockfix::Test::makeEdit;

TEST_SUITE_BEGIN("Conflict");

TEST_CASE("ranges_on_different_lines_do_not_overlap")
{
    CHECK_FALSE(rangesOverlap(Location::range("Dockerfile", 1, 0, 1, 10), Location::range("Dockerfile", 2, 0, 2, 10)));
    CHECK_FALSE(rangesOverlap(Location::range("Dockerfile", 3, 0, 4, 2), Location::range("Dockerfile", 1, 5, 2, 1)));
}

TEST_CASE("adjacent_ranges_do_not_overlap")
{
    // [4, 7) ends exactly where [7, 10) starts
    CHECK_FALSE(rangesOverlap(Location::range("Dockerfile", 1, 4, 1, 7), Location::range("Dockerfile", 1, 7, 1, 10)));
    CHECK_FALSE(rangesOverlap(Location::range("Dockerfile", 1, 7, 1, 10), Location::range("Dockerfile", 1, 4, 1, 7)));
    CHECK_FALSE(rangesOverlap(Location::range("Dockerfile", 1, 4, 2, 0), Location::range("Dockerfile", 2, 0, 2, 3)));
}

TEST_CASE("partially_overlapping_ranges_overlap")
{
    CHECK(rangesOverlap(Location::range("Dockerfile", 1, 4, 1, 15), Location::range("Dockerfile", 1, 4, 1, 7)));
    CHECK(rangesOverlap(Location::range("Dockerfile", 1, 4, 1, 8), Location::range("Dockerfile", 1, 7, 1, 10)));
    CHECK(rangesOverlap(Location::range("Dockerfile", 1, 0, 3, 0), Location::range("Dockerfile", 2, 2, 2, 4)));
}

TEST_CASE("insertion_at_the_boundary_of_a_replacement_does_not_overlap")
{
    CHECK_FALSE(rangesOverlap(Location::range("Dockerfile", 2, 0, 2, 0), Location::range("Dockerfile", 2, 0, 2, 5)));
    CHECK_FALSE(rangesOverlap(Location::range("Dockerfile", 2, 5, 2, 5), Location::range("Dockerfile", 2, 0, 2, 5)));
}

TEST_CASE("insertions_at_one_point_conflict")
{
    CHECK(rangesConflict(Location::range("Dockerfile", 2, 0, 2, 0), Location::range("Dockerfile", 2, 0, 2, 0)));
    CHECK_FALSE(rangesConflict(Location::range("Dockerfile", 2, 0, 2, 0), Location::range("Dockerfile", 3, 0, 3, 0)));
    // An insertion at either end of a replacement is still fine
    CHECK_FALSE(rangesConflict(Location::range("Dockerfile", 1, 3, 1, 3), Location::range("Dockerfile", 1, 0, 1, 3)));
    CHECK_FALSE(rangesConflict(Location::range("Dockerfile", 1, 3, 1, 3), Location::range("Dockerfile", 1, 3, 1, 5)));
    CHECK(rangesConflict(Location::range("Dockerfile", 1, 2, 1, 2), Location::range("Dockerfile", 1, 0, 1, 3)));
}

TEST_CASE("edits_in_different_files_never_overlap")
{
    auto a = makeEdit("a/Dockerfile", 1, 0, 1, 10, "x");
    auto b = makeEdit("b/Dockerfile", 1, 0, 1, 10, "y");
    CHECK_FALSE(editsOverlap(a, b));
    CHECK(editsOverlap(a, makeEdit("a/Dockerfile", 1, 5, 1, 6, "z")));
}

TEST_CASE("edit_start_order")
{
    CHECK(editStartsBefore(makeEdit("Dockerfile", 1, 9, 1, 9, ""), makeEdit("Dockerfile", 2, 0, 2, 0, "")));
    CHECK(editStartsBefore(makeEdit("Dockerfile", 2, 1, 2, 1, ""), makeEdit("Dockerfile", 2, 3, 2, 3, "")));
    CHECK_FALSE(editStartsBefore(makeEdit("Dockerfile", 2, 3, 2, 3, ""), makeEdit("Dockerfile", 2, 3, 2, 8, "")));
}

TEST_CASE("same_length_replacement_produces_no_shift")
{
    CHECK_FALSE(shiftForEdit(makeEdit("Dockerfile", 1, 0, 1, 3, "run")));
}

TEST_CASE("insertion_shifts_the_rest_of_the_line")
{
    auto shift = shiftForEdit(makeEdit("Dockerfile", 2, 0, 2, 0, "    "));
    REQUIRE(shift);
    CHECK_EQ(shift->oldEnd, (Position{2, 0}));
    CHECK_EQ(shift->newEnd, (Position{2, 4}));

    // Later on the same line moves by the inserted width
    CHECK_EQ(adjustPosition(Position{2, 10}, {*shift}), (Position{2, 14}));
    // Other lines stay put
    CHECK_EQ(adjustPosition(Position{3, 10}, {*shift}), (Position{3, 10}));
    CHECK_EQ(adjustPosition(Position{1, 10}, {*shift}), (Position{1, 10}));
}

TEST_CASE("multi_line_replacement_shifts_later_lines")
{
    // Two lines become one
    auto shift = shiftForEdit(makeEdit("Dockerfile", 2, 3, 3, 4, "X"));
    REQUIRE(shift);
    CHECK_EQ(shift->newEnd, (Position{2, 4}));

    CHECK_EQ(adjustPosition(Position{3, 6}, {*shift}), (Position{2, 6}));
    CHECK_EQ(adjustPosition(Position{5, 1}, {*shift}), (Position{4, 1}));

    // One line becomes three
    auto growth = shiftForEdit(makeEdit("Dockerfile", 2, 0, 2, 5, "a\nb\nc"));
    REQUIRE(growth);
    CHECK_EQ(growth->newEnd, (Position{4, 1}));
    CHECK_EQ(adjustPosition(Position{2, 7}, {*growth}), (Position{4, 3}));
    CHECK_EQ(adjustPosition(Position{6, 0}, {*growth}), (Position{8, 0}));
}

TEST_CASE("shifts_compose_in_application_order")
{
    // Indent line 2 by four spaces, then insert a line above it
    std::vector<EditShift> shifts;
    shifts.push_back(*shiftForEdit(makeEdit("Dockerfile", 2, 0, 2, 0, "    ")));
    shifts.push_back(*shiftForEdit(makeEdit("Dockerfile", 2, 0, 2, 0, "# note\n")));

    CHECK_EQ(adjustPosition(Position{2, 6}, shifts), (Position{3, 10}));
}

TEST_CASE("adjust_edit_moves_both_ends")
{
    std::vector<EditShift> shifts{*shiftForEdit(makeEdit("Dockerfile", 1, 4, 1, 7, "apt-get"))};

    auto adjusted = adjustEdit(makeEdit("Dockerfile", 1, 8, 1, 15, "add"), shifts);
    CHECK_EQ(adjusted.location.start, (Position{1, 12}));
    CHECK_EQ(adjusted.location.end, (Position{1, 19}));
    CHECK_EQ(adjusted.newText, "add");

    auto untouched = makeEdit("Dockerfile", 1, 0, 1, 3, "RUN");
    CHECK_EQ(adjustEdit(untouched, {}), untouched);
}

TEST_SUITE_END();
