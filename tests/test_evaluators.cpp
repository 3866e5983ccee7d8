// tests/test_evaluators.cpp
// Tests for evaluators.h: one block per constraint kind.

#include "evaluators.h"
#include "compliance.h"
#include "test_helpers.h"
#include <algorithm>
#include <gtest/gtest.h>

using namespace gc;
using gc_test::as;
using gc_test::place;

// =============================================================================
// RepeatEncounter
// =============================================================================

TEST(RepeatEncounter, ThreeInOneGroupWithZeroAllowed) {
    Schedule s;
    place(s, 0, "G1", {"A", "B", "C"});
    ScheduleIndex idx(s, 1);

    RepeatEncounter c;
    c.max_allowed_encounters = 0;
    auto r = evaluate_repeat_encounter(c, idx);

    EXPECT_FALSE(r.adheres);
    EXPECT_EQ(r.violations_count, 3);
    ASSERT_EQ(r.details.size(), 3u);
    EXPECT_EQ(as<RepeatEncounterDetail>(r.details[0]).pair, (PersonPair{"A", "B"}));
    EXPECT_EQ(as<RepeatEncounterDetail>(r.details[1]).pair, (PersonPair{"A", "C"}));
    EXPECT_EQ(as<RepeatEncounterDetail>(r.details[2]).pair, (PersonPair{"B", "C"}));
}

TEST(RepeatEncounter, CountsExcessAcrossSessions) {
    Schedule s;
    place(s, 0, "G1", {"B", "A"});
    place(s, 1, "G2", {"A", "B"});
    place(s, 2, "G1", {"A", "B"});
    ScheduleIndex idx(s, 3);

    RepeatEncounter c;
    c.max_allowed_encounters = 1;
    auto r = evaluate_repeat_encounter(c, idx);

    EXPECT_EQ(r.violations_count, 2);
    ASSERT_EQ(r.details.size(), 1u);
    const auto& d = as<RepeatEncounterDetail>(r.details[0]);
    EXPECT_EQ(d.pair, (PersonPair{"A", "B"}));
    EXPECT_EQ(d.count, 3);
    EXPECT_EQ(d.max_allowed, 1);
    EXPECT_EQ(d.sessions, (std::vector<int>{0, 1, 2}));
}

TEST(RepeatEncounter, SquaredPenaltyDoesNotChangeRawCount) {
    Schedule s;
    place(s, 0, "G1", {"A", "B"});
    place(s, 1, "G1", {"A", "B"});
    place(s, 2, "G1", {"A", "B"});
    ScheduleIndex idx(s, 3);

    RepeatEncounter linear;
    linear.max_allowed_encounters = 1;
    RepeatEncounter squared = linear;
    squared.penalty_function = PenaltyFunction::Squared;

    EXPECT_EQ(evaluate_repeat_encounter(linear, idx).violations_count, 2);
    EXPECT_EQ(evaluate_repeat_encounter(squared, idx).violations_count, 2);
}

TEST(RepeatEncounter, OrderOfRecordsDoesNotMatter) {
    Schedule s;
    place(s, 0, "G1", {"A", "B", "C"});
    place(s, 0, "G2", {"D", "E"});
    place(s, 1, "G1", {"A", "D"});
    place(s, 1, "G2", {"B", "C", "E"});
    place(s, 2, "G1", {"A", "B"});
    place(s, 2, "G2", {"C", "D", "E"});

    RepeatEncounter c;
    c.max_allowed_encounters = 1;

    ScheduleIndex idx(s, 3);
    const int expected = evaluate_repeat_encounter(c, idx).violations_count;
    EXPECT_GT(expected, 0);

    Schedule reversed(s.rbegin(), s.rend());
    ScheduleIndex ridx(reversed, 3);
    EXPECT_EQ(evaluate_repeat_encounter(c, ridx).violations_count, expected);

    Schedule rotated = s;
    std::rotate(rotated.begin(), rotated.begin() + 5, rotated.end());
    ScheduleIndex rotidx(rotated, 3);
    EXPECT_EQ(evaluate_repeat_encounter(c, rotidx).violations_count, expected);
}

TEST(RepeatEncounter, IdsContainingSeparatorsKeepBothFindings) {
    Schedule s;
    place(s, 0, "G1", {"a|b", "c"});
    place(s, 0, "G2", {"a", "b|c"});
    ScheduleIndex idx(s, 1);

    RepeatEncounter c;
    c.max_allowed_encounters = 0;
    const Problem p = gc_test::problem_with(1, {"a|b", "c", "a", "b|c"}, {"G1", "G2"}, {c});
    const auto report = build_compliance_report(p, idx);
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report[0].violations_count, 2);
    EXPECT_EQ(report[0].details.size(), 2u);
}

TEST(RepeatEncounter, EmptyScheduleAdheres) {
    ScheduleIndex idx(Schedule{}, 4);
    RepeatEncounter c;
    auto r = evaluate_repeat_encounter(c, idx);
    EXPECT_TRUE(r.adheres);
    EXPECT_EQ(r.violations_count, 0);
    EXPECT_TRUE(r.details.empty());
}

// =============================================================================
// AttributeBalance
// =============================================================================

namespace {

std::vector<Person> gendered_people() {
    return {
        gc_test::person("m1", {{"gender", "male"}}),
        gc_test::person("m2", {{"gender", "male"}}),
        gc_test::person("m3", {{"gender", "male"}}),
        gc_test::person("f1", {{"gender", "female"}}),
        gc_test::person("x1"),
    };
}

AttributeBalance gender_balance(BalanceMode mode) {
    AttributeBalance c;
    c.group_id = "G1";
    c.attribute_key = "gender";
    c.desired_values = {{"male", 2}, {"female", 2}};
    c.mode = mode;
    return c;
}

} // namespace

TEST(AttributeBalance, ExactCountsBothDirections) {
    const auto people = gendered_people();
    const auto lookup = build_person_index(people);
    Schedule s;
    place(s, 0, "G1", {"m1", "m2", "m3", "f1"});
    ScheduleIndex idx(s, 1);

    auto r = evaluate_attribute_balance(gender_balance(BalanceMode::Exact), idx, lookup);
    EXPECT_EQ(r.violations_count, 2);
    EXPECT_FALSE(r.adheres);
    ASSERT_EQ(r.details.size(), 2u);

    // desired_values iterate in key order: female, male
    const auto& female = as<AttributeBalanceDetail>(r.details[0]);
    EXPECT_EQ(female.attribute_value, "female");
    EXPECT_EQ(female.desired, 2);
    EXPECT_EQ(female.actual, 1);
    const auto& male = as<AttributeBalanceDetail>(r.details[1]);
    EXPECT_EQ(male.attribute_value, "male");
    EXPECT_EQ(male.actual, 3);
}

TEST(AttributeBalance, AtLeastIgnoresOvershoot) {
    const auto people = gendered_people();
    const auto lookup = build_person_index(people);
    Schedule s;
    place(s, 0, "G1", {"m1", "m2", "m3", "f1"});
    ScheduleIndex idx(s, 1);

    auto r = evaluate_attribute_balance(gender_balance(BalanceMode::AtLeast), idx, lookup);
    EXPECT_EQ(r.violations_count, 1);
    ASSERT_EQ(r.details.size(), 1u);
    EXPECT_EQ(as<AttributeBalanceDetail>(r.details[0]).attribute_value, "female");
}

TEST(AttributeBalance, UndesiredValuesAreUnconstrained) {
    const auto people = gendered_people();
    const auto lookup = build_person_index(people);
    Schedule s;
    place(s, 0, "G1", {"m1", "m2", "f1", "x1"});
    ScheduleIndex idx(s, 1);

    AttributeBalance c = gender_balance(BalanceMode::Exact);
    c.desired_values = {{"male", 2}, {"female", 1}};
    auto r = evaluate_attribute_balance(c, idx, lookup);
    EXPECT_TRUE(r.adheres);
}

TEST(AttributeBalance, MissingAttributeGoesToSentinelBucket) {
    const auto people = gendered_people();
    const auto lookup = build_person_index(people);
    Schedule s;
    place(s, 0, "G1", {"x1", "ghost"});
    ScheduleIndex idx(s, 1);

    AttributeBalance c = gender_balance(BalanceMode::Exact);
    c.desired_values = {{kUnknownAttributeValue, 2}};
    EXPECT_TRUE(evaluate_attribute_balance(c, idx, lookup).adheres);
}

TEST(AttributeBalance, OnlySelectedSessions) {
    const auto people = gendered_people();
    const auto lookup = build_person_index(people);
    Schedule s;
    place(s, 0, "G1", {"m1", "m2", "m3", "f1"});
    place(s, 1, "G1", {"m1", "f1"});
    ScheduleIndex idx(s, 2);

    AttributeBalance c = gender_balance(BalanceMode::Exact);
    c.desired_values = {{"male", 1}, {"female", 1}};
    c.sessions = std::vector<int>{1};
    EXPECT_TRUE(evaluate_attribute_balance(c, idx, lookup).adheres);

    c.sessions.reset();
    auto r = evaluate_attribute_balance(c, idx, lookup);
    EXPECT_EQ(r.violations_count, 2);
    EXPECT_EQ(as<AttributeBalanceDetail>(r.details[0]).session, 0);
}

// =============================================================================
// ImmovablePeople / ImmovablePerson
// =============================================================================

TEST(Immovable, ReportsWrongAndMissingPlacement) {
    Schedule s;
    place(s, 0, "G1", {"A"});
    place(s, 0, "G2", {"B"});
    place(s, 1, "G1", {"A", "B"});
    ScheduleIndex idx(s, 3);

    auto r = evaluate_immovable({"A", "B"}, "G1", std::nullopt, idx);
    // s0: B in G2; s2: A and B unassigned
    EXPECT_EQ(r.violations_count, 3);
    ASSERT_EQ(r.details.size(), 3u);
    const auto& wrong = as<ImmovableDetail>(r.details[0]);
    EXPECT_EQ(wrong.session, 0);
    EXPECT_EQ(wrong.person_id, "B");
    EXPECT_EQ(wrong.required_group, "G1");
    EXPECT_EQ(wrong.assigned_group, std::optional<std::string>("G2"));
    EXPECT_EQ(as<ImmovableDetail>(r.details[1]).assigned_group, std::nullopt);
}

TEST(Immovable, NonexistentGroupIsAVisibleViolation) {
    Schedule s;
    place(s, 0, "G1", {"A"});
    ScheduleIndex idx(s, 1);
    auto r = evaluate_immovable({"A"}, "NoSuchGroup", std::nullopt, idx);
    EXPECT_EQ(r.violations_count, 1);
}

TEST(Immovable, LegacySingularFormMatchesPlural) {
    Schedule s;
    place(s, 0, "G2", {"A"});
    place(s, 1, "G1", {"A"});
    ScheduleIndex idx(s, 2);
    const PersonIndex none;

    ImmovablePerson single{"A", "G1", std::nullopt};
    ImmovablePeople plural{{"A"}, "G1", std::nullopt};
    auto a = evaluate_constraint(single, idx, none);
    auto b = evaluate_constraint(plural, idx, none);
    EXPECT_EQ(a.violations_count, 1);
    EXPECT_EQ(a.violations_count, b.violations_count);
    EXPECT_EQ(a.details.size(), b.details.size());
}

// =============================================================================
// MustStayTogether / ShouldStayTogether
// =============================================================================

TEST(StayTogether, SplitAcrossTwoGroups) {
    Schedule s;
    place(s, 0, "G1", {"A"});
    place(s, 0, "G2", {"B"});
    ScheduleIndex idx(s, 1);

    auto r = evaluate_constraint(MustStayTogether{{"A", "B"}, std::nullopt}, idx, PersonIndex{});
    EXPECT_EQ(r.violations_count, 1);
    ASSERT_EQ(r.details.size(), 1u);
    const auto& d = as<TogetherSplitDetail>(r.details[0]);
    EXPECT_EQ(d.session, 0);
    ASSERT_EQ(d.people.size(), 2u);
    EXPECT_EQ(d.people[0].person_id, "A");
    EXPECT_EQ(d.people[0].group_id, std::optional<std::string>("G1"));
    EXPECT_EQ(d.people[1].person_id, "B");
    EXPECT_EQ(d.people[1].group_id, std::optional<std::string>("G2"));
}

TEST(StayTogether, UnassignedMemberCountsOnce) {
    Schedule s;
    place(s, 0, "G1", {"A", "B"});
    ScheduleIndex idx(s, 1);

    auto r = evaluate_stay_together({"A", "B", "C"}, std::nullopt, idx);
    EXPECT_EQ(r.violations_count, 1);
    ASSERT_EQ(r.details.size(), 1u);
    EXPECT_EQ(as<TogetherSplitDetail>(r.details[0]).people[2].group_id, std::nullopt);
}

TEST(StayTogether, ThreeGroupsGiveTwoViolations) {
    Schedule s;
    place(s, 0, "G1", {"A"});
    place(s, 0, "G2", {"B"});
    place(s, 0, "G3", {"C"});
    place(s, 1, "G1", {"A", "B", "C"});
    ScheduleIndex idx(s, 2);

    ShouldStayTogether c;
    c.people = {"A", "B", "C"};
    auto r = evaluate_constraint(c, idx, PersonIndex{});
    EXPECT_EQ(r.violations_count, 2);
    ASSERT_EQ(r.details.size(), 1u);
}

// =============================================================================
// ShouldNotBeTogether
// =============================================================================

TEST(NotTogether, IntersectionBeyondOneIsViolation) {
    Schedule s;
    place(s, 0, "G1", {"C", "X", "A", "B"});
    place(s, 0, "G2", {"D"});
    place(s, 1, "G1", {"A"});
    place(s, 1, "G2", {"B", "C"});
    ScheduleIndex idx(s, 2);

    ShouldNotBeTogether c;
    c.people = {"A", "B", "C", "D"};
    auto r = evaluate_not_together(c, idx);
    EXPECT_EQ(r.violations_count, 3);
    ASSERT_EQ(r.details.size(), 2u);
    const auto& first = as<NotTogetherDetail>(r.details[0]);
    EXPECT_EQ(first.session, 0);
    EXPECT_EQ(first.group_id, "G1");
    EXPECT_EQ(first.people, (std::vector<std::string>{"C", "A", "B"}));
    EXPECT_EQ(as<NotTogetherDetail>(r.details[1]).group_id, "G2");
}

// =============================================================================
// PairMeetingCount
// =============================================================================

namespace {

Schedule meets_in_zero_and_two() {
    Schedule s;
    place(s, 0, "G1", {"A", "B"});
    place(s, 1, "G1", {"A"});
    place(s, 1, "G2", {"B"});
    place(s, 2, "G2", {"B", "A"});
    return s;
}

PairMeetingCount pair_rule(MeetingMode mode, int target) {
    PairMeetingCount c;
    c.people = {"A", "B"};
    c.mode = mode;
    c.target_meetings = target;
    return c;
}

} // namespace

TEST(PairMeetingCount, AtLeastSatisfiedStillNarratesEverySession) {
    const Schedule s = meets_in_zero_and_two();
    ScheduleIndex idx(s, 3);

    auto r = evaluate_pair_meeting_count(pair_rule(MeetingMode::AtLeast, 2), idx);
    EXPECT_TRUE(r.adheres);
    EXPECT_EQ(r.violations_count, 0);
    ASSERT_EQ(r.details.size(), 4u);

    const auto& summary = as<PairMeetingSummaryDetail>(r.details[0]);
    EXPECT_EQ(summary.actual, 2);
    EXPECT_EQ(summary.target, 2);
    EXPECT_EQ(summary.sessions, (std::vector<int>{0, 1, 2}));

    EXPECT_EQ(as<PairMeetingTogetherDetail>(r.details[1]).group_id, std::optional<std::string>("G1"));
    EXPECT_TRUE(std::holds_alternative<PairMeetingApartDetail>(r.details[2]));
    EXPECT_EQ(as<PairMeetingTogetherDetail>(r.details[3]).group_id, std::optional<std::string>("G2"));
}

TEST(PairMeetingCount, DeviationByMode) {
    const Schedule s = meets_in_zero_and_two();
    ScheduleIndex idx(s, 3);
    EXPECT_EQ(evaluate_pair_meeting_count(pair_rule(MeetingMode::AtLeast, 3), idx).violations_count, 1);
    EXPECT_EQ(evaluate_pair_meeting_count(pair_rule(MeetingMode::Exact, 0), idx).violations_count, 2);
    EXPECT_EQ(evaluate_pair_meeting_count(pair_rule(MeetingMode::Exact, 3), idx).violations_count, 1);
    EXPECT_EQ(evaluate_pair_meeting_count(pair_rule(MeetingMode::AtMost, 1), idx).violations_count, 1);
    EXPECT_EQ(evaluate_pair_meeting_count(pair_rule(MeetingMode::AtMost, 2), idx).violations_count, 0);
}

TEST(PairMeetingCount, SessionSubsetAndEmptyList) {
    const Schedule s = meets_in_zero_and_two();
    ScheduleIndex idx(s, 3);

    auto c = pair_rule(MeetingMode::Exact, 1);
    c.sessions = std::vector<int>{1, 2};
    auto r = evaluate_pair_meeting_count(c, idx);
    EXPECT_TRUE(r.adheres);
    EXPECT_EQ(r.details.size(), 3u);

    c.sessions = std::vector<int>{};
    r = evaluate_pair_meeting_count(c, idx);
    EXPECT_EQ(as<PairMeetingSummaryDetail>(r.details[0]).sessions.size(), 3u);
    EXPECT_EQ(r.violations_count, 1);
}

// =============================================================================
// Unknown constraint kinds
// =============================================================================

TEST(UnknownConstraint, AssumedSatisfied) {
    Schedule s;
    place(s, 0, "G1", {"A", "B"});
    ScheduleIndex idx(s, 1);
    auto r = evaluate_constraint(UnknownConstraint{"FutureKind"}, idx, PersonIndex{});
    EXPECT_TRUE(r.adheres);
    EXPECT_EQ(r.violations_count, 0);
    EXPECT_TRUE(r.details.empty());
    EXPECT_FALSE(r.recognized);
}
