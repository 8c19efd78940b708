/// @file test_label_placer.cpp
/// @brief Unit tests for greedy label selection.

#include <doctest/doctest.h>

#include "chart/label_candidates.hpp"
#include "chart/label_placer.hpp"
#include "chart/repulsion_field.hpp"

using namespace skychart;
using namespace skychart::chart;

static constexpr f64 kFieldRadius = 88.2;
static constexpr f64 kFontSize = 2.6;
static constexpr f64 kLabelWidth = 6.5;

TEST_CASE("Empty field keeps the first candidate")
{
    const RepulsionField field{kFieldRadius, {}};
    const CandidateList candidates = box_candidates(2.0, 2.0, kLabelWidth, kFontSize);

    CHECK(select_candidate(field, candidates) == 0);
}

TEST_CASE("Selection is deterministic")
{
    const RepulsionField field{kFieldRadius, {{Vec2d{1.0, -4.0}, 1.0}, {Vec2d{-5.0, 2.0}, 2.0}}};
    const CandidateList candidates = box_candidates(2.0, 2.0, kLabelWidth, kFontSize);

    const std::size_t first = select_candidate(field, candidates);
    for (int i = 0; i < 10; ++i)
    {
        CHECK(select_candidate(field, candidates) == first);
    }
}

TEST_CASE("A crowded slot is avoided")
{
    const CandidateList candidates = box_candidates(2.0, 2.0, kLabelWidth, kFontSize);

    SUBCASE("Neighbour below")
    {
        const RepulsionField field{kFieldRadius, {{candidates[0].center, 1.0}}};
        CHECK(select_candidate(field, candidates) != 0);
    }

    SUBCASE("Neighbours below and on the right")
    {
        const RepulsionField field{kFieldRadius, {{candidates[0].center, 1.0}, {candidates[3].center, 1.0}}};
        const std::size_t slot = select_candidate(field, candidates);
        CHECK(slot != 0);
        CHECK(slot != 3);
    }

    SUBCASE("Neighbours everywhere but the left")
    {
        const RepulsionField field{kFieldRadius, {
            {candidates[0].center, 1.0},
            {candidates[1].center, 1.0},
            {candidates[3].center, 1.0},
        }};
        CHECK(select_candidate(field, candidates) == static_cast<std::size_t>(LabelSlot::Left));
    }
}

TEST_CASE("The labelled symbol's own source can be excluded")
{
    const CandidateList candidates = box_candidates(2.0, 2.0, kLabelWidth, kFontSize);
    // Source 0 sits right on the first candidate; source 1 is far away above.
    const RepulsionField field{kFieldRadius, {{candidates[0].center, 1.0}, {Vec2d{0.0, 60.0}, 1.0}}};

    CHECK(select_candidate(field, candidates) != 0);
    CHECK(select_candidate(field, candidates, 0) == 0);
}

TEST_CASE("Committing a label adds one source at the candidate centre")
{
    RepulsionField field{kFieldRadius, {}};
    const CandidateList candidates = box_candidates(2.0, 2.0, kLabelWidth, kFontSize);

    commit_candidate(field, candidates[2], kLabelWidth);

    CHECK(field.source_count() == 1);
    CHECK(field.potential(candidates[2].center) == doctest::Approx(1.0));
}

TEST_CASE("A second label around the same symbol moves to another slot")
{
    RepulsionField field{kFieldRadius, {}};
    const CandidateList candidates = box_candidates(2.0, 2.0, kLabelWidth, kFontSize);

    const std::size_t first = place_label(field, candidates, kLabelWidth);
    const std::size_t second = place_label(field, candidates, kLabelWidth);

    CHECK(first == 0);
    CHECK(second != first);
    CHECK(field.source_count() == 2);
}
