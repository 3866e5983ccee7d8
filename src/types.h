// types.h
#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gc {

// Absent => every session in [0, num_sessions).
using SessionSet = std::optional<std::vector<int>>;

// Always stored with first <= second once produced by an evaluator.
using PersonPair = std::pair<std::string, std::string>;

struct Person {
  std::string id;
  std::map<std::string, std::string> attributes;   // e.g. {"gender": "female"}
  SessionSet allowed_sessions;                      // sessions this person attends
};

struct Group {
  std::string id;
  int capacity = 0;   // people per session; upheld upstream, not checked here
};

struct Assignment {
  int session_id = 0;
  std::string group_id;
  std::string person_id;
};

// A final solution or an intermediate snapshot; both look the same.
using Schedule = std::vector<Assignment>;

// Optimizer score breakdown, only used for the before/after header of a diff.
struct ScoreSummary {
  double final_score = 0.0;
  double unique_contacts = 0.0;
  double repetition_penalty = 0.0;
  double attribute_balance_penalty = 0.0;
  double constraint_penalty = 0.0;
};

struct Solution {
  Schedule assignments;
  ScoreSummary score;
};

enum class PenaltyFunction { Linear, Squared };
enum class BalanceMode { Exact, AtLeast };
enum class MeetingMode { AtLeast, Exact, AtMost };

// ---- Constraints ----

struct RepeatEncounter {
  int max_allowed_encounters = 1;
  PenaltyFunction penalty_function = PenaltyFunction::Linear; // weighting hint only
  double penalty_weight = 1.0;
};

struct AttributeBalance {
  std::string group_id;
  std::string attribute_key;
  std::map<std::string, int> desired_values;   // value -> desired head count
  SessionSet sessions;
  BalanceMode mode = BalanceMode::Exact;
  double penalty_weight = 1.0;
};

struct ImmovablePeople {
  std::vector<std::string> people;
  std::string group_id;
  SessionSet sessions;
};

// Legacy single-person form of ImmovablePeople.
struct ImmovablePerson {
  std::string person_id;
  std::string group_id;
  SessionSet sessions;
};

struct MustStayTogether {
  std::vector<std::string> people;
  SessionSet sessions;
};

struct ShouldStayTogether {
  std::vector<std::string> people;
  SessionSet sessions;
  double penalty_weight = 1000.0;
};

struct ShouldNotBeTogether {
  std::vector<std::string> people;
  SessionSet sessions;
  double penalty_weight = 1000.0;
};

struct PairMeetingCount {
  PersonPair people;
  int target_meetings = 0;
  MeetingMode mode = MeetingMode::AtLeast;
  SessionSet sessions;   // empty list also means every session
  double penalty_weight = 1.0;
};

// A tag this build does not know. Evaluates as satisfied.
struct UnknownConstraint {
  std::string type_name;
};

using Constraint = std::variant<RepeatEncounter,
                                AttributeBalance,
                                ImmovablePeople,
                                ImmovablePerson,
                                MustStayTogether,
                                ShouldStayTogether,
                                ShouldNotBeTogether,
                                PairMeetingCount,
                                UnknownConstraint>;

struct Problem {
  std::vector<Person> people;
  std::vector<Group> groups;
  int num_sessions = 0;
  std::vector<Constraint> constraints;   // position == identity
};

// Tag as written in problem JSON ("RepeatEncounter", ...).
std::string constraint_type_name(const Constraint& c);

// Hard constraints carry no tunable weight.
bool is_hard(const Constraint& c);

// Declared weight, or 1 for hard and unknown constraints.
double penalty_weight_of(const Constraint& c);

// ---- Violation details ----

struct RepeatEncounterDetail {
  PersonPair pair;
  int count = 0;
  int max_allowed = 0;
  std::vector<int> sessions;   // ascending
};

struct AttributeBalanceDetail {
  int session = 0;
  std::string group_id;
  std::string attribute_value;
  int desired = 0;
  int actual = 0;
};

struct ImmovableDetail {
  int session = 0;
  std::string person_id;
  std::string required_group;
  std::optional<std::string> assigned_group;   // nullopt => unassigned
};

struct PersonPlacement {
  std::string person_id;
  std::optional<std::string> group_id;
};

struct TogetherSplitDetail {
  int session = 0;
  std::vector<PersonPlacement> people;
};

struct NotTogetherDetail {
  int session = 0;
  std::string group_id;
  std::vector<std::string> people;
};

struct PairMeetingSummaryDetail {
  PersonPair people;
  int target = 0;
  int actual = 0;
  MeetingMode mode = MeetingMode::AtLeast;
  std::vector<int> sessions;
};

struct PairMeetingTogetherDetail {
  int session = 0;
  PersonPair people;
  std::optional<std::string> group_id;
};

struct PairMeetingApartDetail {
  int session = 0;
  PersonPair people;
  std::optional<std::string> group_id;
};

using ViolationDetail = std::variant<RepeatEncounterDetail,
                                     AttributeBalanceDetail,
                                     ImmovableDetail,
                                     TogetherSplitDetail,
                                     NotTogetherDetail,
                                     PairMeetingSummaryDetail,
                                     PairMeetingTogetherDetail,
                                     PairMeetingApartDetail>;

// "RepeatEncounter", "AttributeBalance", "Immovable", "TogetherSplit", ...
std::string detail_kind(const ViolationDetail& d);

// ---- Evaluation output ----

// Evaluation of one constraint against one schedule. adheres == (violations_count == 0).
struct ComplianceResult {
  int constraint_index = 0;
  std::string type;
  std::string title;
  std::string subtitle;
  bool is_hard = false;
  bool recognized = true;        // false => unknown tag, assumed satisfied
  double penalty_weight = 1.0;
  bool adheres = true;
  int violations_count = 0;
  std::vector<ViolationDetail> details;
};

// One entry per constraint, in constraint-list order.
using ComplianceReport = std::vector<ComplianceResult>;

// Wire names: "linear"/"squared", "exact"/"at_least", "at_least"/"exact"/"at_most".
std::string to_string(PenaltyFunction f);
std::string to_string(BalanceMode m);
std::string to_string(MeetingMode m);

} // namespace gc
