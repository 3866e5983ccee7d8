#include "types.h"

namespace gc {

namespace {

struct TypeNameVisitor {
  std::string operator()(const RepeatEncounter&) const { return "RepeatEncounter"; }
  std::string operator()(const AttributeBalance&) const { return "AttributeBalance"; }
  std::string operator()(const ImmovablePeople&) const { return "ImmovablePeople"; }
  std::string operator()(const ImmovablePerson&) const { return "ImmovablePerson"; }
  std::string operator()(const MustStayTogether&) const { return "MustStayTogether"; }
  std::string operator()(const ShouldStayTogether&) const { return "ShouldStayTogether"; }
  std::string operator()(const ShouldNotBeTogether&) const { return "ShouldNotBeTogether"; }
  std::string operator()(const PairMeetingCount&) const { return "PairMeetingCount"; }
  std::string operator()(const UnknownConstraint& u) const { return u.type_name; }
};

struct WeightVisitor {
  double operator()(const RepeatEncounter& c) const { return c.penalty_weight; }
  double operator()(const AttributeBalance& c) const { return c.penalty_weight; }
  double operator()(const ImmovablePeople&) const { return 1.0; }
  double operator()(const ImmovablePerson&) const { return 1.0; }
  double operator()(const MustStayTogether&) const { return 1.0; }
  double operator()(const ShouldStayTogether& c) const { return c.penalty_weight; }
  double operator()(const ShouldNotBeTogether& c) const { return c.penalty_weight; }
  double operator()(const PairMeetingCount& c) const { return c.penalty_weight; }
  double operator()(const UnknownConstraint&) const { return 1.0; }
};

struct DetailKindVisitor {
  std::string operator()(const RepeatEncounterDetail&) const { return "RepeatEncounter"; }
  std::string operator()(const AttributeBalanceDetail&) const { return "AttributeBalance"; }
  std::string operator()(const ImmovableDetail&) const { return "Immovable"; }
  std::string operator()(const TogetherSplitDetail&) const { return "TogetherSplit"; }
  std::string operator()(const NotTogetherDetail&) const { return "NotTogether"; }
  std::string operator()(const PairMeetingSummaryDetail&) const { return "PairMeetingCountSummary"; }
  std::string operator()(const PairMeetingTogetherDetail&) const { return "PairMeetingTogether"; }
  std::string operator()(const PairMeetingApartDetail&) const { return "PairMeetingApart"; }
};

} // namespace

std::string constraint_type_name(const Constraint& c) {
  return std::visit(TypeNameVisitor{}, c);
}

bool is_hard(const Constraint& c) {
  return std::holds_alternative<ImmovablePeople>(c) ||
         std::holds_alternative<ImmovablePerson>(c) ||
         std::holds_alternative<MustStayTogether>(c);
}

double penalty_weight_of(const Constraint& c) {
  return std::visit(WeightVisitor{}, c);
}

std::string detail_kind(const ViolationDetail& d) {
  return std::visit(DetailKindVisitor{}, d);
}

std::string to_string(PenaltyFunction f) {
  return f == PenaltyFunction::Squared ? "squared" : "linear";
}

std::string to_string(BalanceMode m) {
  return m == BalanceMode::AtLeast ? "at_least" : "exact";
}

std::string to_string(MeetingMode m) {
  switch (m) {
    case MeetingMode::Exact:  return "exact";
    case MeetingMode::AtMost: return "at_most";
    case MeetingMode::AtLeast: break;
  }
  return "at_least";
}

} // namespace gc
