// problem_io.cpp
#include "problem_io.h"

#include <stdexcept>
#include <string>

namespace gc {

[[noreturn]] static void fail(const std::string& msg) {
  throw std::runtime_error(msg);
}

// ---------- decoding helpers ----------

static SessionSet parse_sessions(const json& j) {
  if (!j.contains("sessions") || j["sessions"].is_null()) return std::nullopt;
  return j.at("sessions").get<std::vector<int>>();
}

static std::vector<std::string> parse_people(const json& j) {
  return j.at("people").get<std::vector<std::string>>();
}

static PenaltyFunction parse_penalty_function(const std::string& s) {
  if (s == "linear") return PenaltyFunction::Linear;
  if (s == "squared") return PenaltyFunction::Squared;
  fail("Unknown penalty_function: " + s);
}

static BalanceMode parse_balance_mode(const json& j) {
  const std::string s = j.value("mode", std::string("exact"));
  if (s == "exact") return BalanceMode::Exact;
  if (s == "at_least") return BalanceMode::AtLeast;
  fail("Unknown AttributeBalance mode: " + s);
}

static MeetingMode parse_meeting_mode(const json& j) {
  const std::string s = j.value("mode", std::string("at_least"));
  if (s == "at_least") return MeetingMode::AtLeast;
  if (s == "exact") return MeetingMode::Exact;
  if (s == "at_most") return MeetingMode::AtMost;
  fail("Unknown PairMeetingCount mode: " + s);
}

static Person parse_person(const json& j) {
  Person p;
  p.id = j.at("id").get<std::string>();
  if (j.contains("attributes") && !j["attributes"].is_null())
    p.attributes = j.at("attributes").get<std::map<std::string, std::string>>();
  p.allowed_sessions = parse_sessions(j);
  return p;
}

static Group parse_group(const json& j) {
  Group g;
  g.id = j.at("id").get<std::string>();
  g.capacity = j.at("size").get<int>();
  return g;
}

static Assignment parse_assignment(const json& j) {
  Assignment a;
  a.person_id = j.at("person_id").get<std::string>();
  a.group_id = j.at("group_id").get<std::string>();
  a.session_id = j.at("session_id").get<int>();
  return a;
}

static const json& required(const json& j, const char* key, const std::string& where) {
  if (!j.is_object() || !j.contains(key)) fail(where + " is missing required field: " + key);
  return j.at(key);
}

// ---------- decoding ----------

static Constraint decode_constraint(const json& j) {
  const std::string type = j.at("type").get<std::string>();

  if (type == "RepeatEncounter") {
    RepeatEncounter c;
    c.max_allowed_encounters = j.at("max_allowed_encounters").get<int>();
    c.penalty_function = parse_penalty_function(j.value("penalty_function", std::string("linear")));
    c.penalty_weight = j.at("penalty_weight").get<double>();
    return c;
  }
  if (type == "AttributeBalance") {
    AttributeBalance c;
    c.group_id = j.at("group_id").get<std::string>();
    c.attribute_key = j.at("attribute_key").get<std::string>();
    c.desired_values = j.at("desired_values").get<std::map<std::string, int>>();
    c.penalty_weight = j.at("penalty_weight").get<double>();
    c.mode = parse_balance_mode(j);
    c.sessions = parse_sessions(j);
    return c;
  }
  if (type == "ImmovablePeople") {
    ImmovablePeople c;
    c.people = parse_people(j);
    c.group_id = j.at("group_id").get<std::string>();
    c.sessions = parse_sessions(j);
    return c;
  }
  if (type == "ImmovablePerson") {
    ImmovablePerson c;
    c.person_id = j.at("person_id").get<std::string>();
    c.group_id = j.at("group_id").get<std::string>();
    c.sessions = parse_sessions(j);
    return c;
  }
  if (type == "MustStayTogether") {
    MustStayTogether c;
    c.people = parse_people(j);
    c.sessions = parse_sessions(j);
    return c;
  }
  if (type == "ShouldStayTogether") {
    ShouldStayTogether c;
    c.people = parse_people(j);
    c.sessions = parse_sessions(j);
    c.penalty_weight = j.value("penalty_weight", 1000.0);
    return c;
  }
  if (type == "ShouldNotBeTogether") {
    ShouldNotBeTogether c;
    c.people = parse_people(j);
    c.sessions = parse_sessions(j);
    c.penalty_weight = j.value("penalty_weight", 1000.0);
    return c;
  }
  if (type == "PairMeetingCount") {
    PairMeetingCount c;
    const auto people = parse_people(j);
    if (people.size() != 2)
      fail("PairMeetingCount needs exactly 2 people, got " + std::to_string(people.size()) + ".");
    c.people = {people[0], people[1]};
    c.target_meetings = j.at("target_meetings").get<int>();
    c.mode = parse_meeting_mode(j);
    c.sessions = parse_sessions(j);
    c.penalty_weight = j.value("penalty_weight", 1.0);
    return c;
  }
  return UnknownConstraint{type};
}

Constraint parse_constraint(const json& j) {
  if (!j.is_object()) fail("Constraint must be a JSON object.");
  try {
    return decode_constraint(j);
  } catch (const json::exception& e) {
    fail(std::string("constraint: ") + e.what());
  }
}

ScoreSummary parse_score_summary(const json& j) {
  ScoreSummary s;
  s.final_score = j.value("final_score", 0.0);
  s.unique_contacts = j.value("unique_contacts", 0.0);
  s.repetition_penalty = j.value("repetition_penalty", 0.0);
  s.attribute_balance_penalty = j.value("attribute_balance_penalty", 0.0);
  s.constraint_penalty = j.value("constraint_penalty", 0.0);
  return s;
}

Problem parse_problem(const json& j) {
  if (!j.is_object()) fail("Problem must be a JSON object.");
  const json& body = j.contains("problem") ? j.at("problem") : j;

  Problem p;
  try {
    p.num_sessions = body.at("num_sessions").get<int>();
  } catch (const json::exception& e) {
    fail(std::string("problem.num_sessions: ") + e.what());
  }

  const json& people = required(body, "people", "problem");
  if (!people.is_array()) fail("problem.people must be an array.");
  for (size_t i = 0; i < people.size(); ++i) {
    try { p.people.push_back(parse_person(people[i])); }
    catch (const json::exception& e) { fail("problem.people[" + std::to_string(i) + "]: " + e.what()); }
  }

  const json& groups = required(body, "groups", "problem");
  if (!groups.is_array()) fail("problem.groups must be an array.");
  for (size_t i = 0; i < groups.size(); ++i) {
    try { p.groups.push_back(parse_group(groups[i])); }
    catch (const json::exception& e) { fail("problem.groups[" + std::to_string(i) + "]: " + e.what()); }
  }

  // Constraints sit beside "problem" in the solver envelope.
  const json* constraints = nullptr;
  if (j.contains("constraints")) constraints = &j.at("constraints");
  else if (body.contains("constraints")) constraints = &body.at("constraints");
  if (constraints) {
    if (!constraints->is_array()) fail("constraints must be an array.");
    for (size_t i = 0; i < constraints->size(); ++i) {
      try { p.constraints.push_back(parse_constraint((*constraints)[i])); }
      catch (const std::runtime_error& e) { fail("constraints[" + std::to_string(i) + "]: " + e.what()); }
    }
  }
  return p;
}

Solution parse_solution(const json& j) {
  Solution s;
  const json* records = nullptr;
  if (j.is_array()) {
    records = &j;
  } else if (j.is_object()) {
    records = &required(j, "assignments", "solution");
    s.score = parse_score_summary(j);
  } else {
    fail("Solution must be an object or an array of assignments.");
  }
  if (!records->is_array()) fail("solution.assignments must be an array.");

  s.assignments.reserve(records->size());
  for (size_t i = 0; i < records->size(); ++i) {
    try { s.assignments.push_back(parse_assignment((*records)[i])); }
    catch (const json::exception& e) { fail("assignments[" + std::to_string(i) + "]: " + e.what()); }
  }
  return s;
}

// ---------- encoding ----------

static json pair_json(const PersonPair& p) {
  return json::array({p.first, p.second});
}

static json optional_group(const std::optional<std::string>& g) {
  return g ? json(*g) : json(nullptr);
}

static void put_sessions(json& j, const SessionSet& s) {
  if (s) j["sessions"] = *s;
}

json constraint_to_json(const Constraint& c) {
  json j;
  j["type"] = constraint_type_name(c);
  if (auto p = std::get_if<RepeatEncounter>(&c)) {
    j["max_allowed_encounters"] = p->max_allowed_encounters;
    j["penalty_function"] = to_string(p->penalty_function);
    j["penalty_weight"] = p->penalty_weight;
  } else if (auto p = std::get_if<AttributeBalance>(&c)) {
    j["group_id"] = p->group_id;
    j["attribute_key"] = p->attribute_key;
    j["desired_values"] = p->desired_values;
    j["penalty_weight"] = p->penalty_weight;
    j["mode"] = to_string(p->mode);
    put_sessions(j, p->sessions);
  } else if (auto p = std::get_if<ImmovablePeople>(&c)) {
    j["people"] = p->people;
    j["group_id"] = p->group_id;
    put_sessions(j, p->sessions);
  } else if (auto p = std::get_if<ImmovablePerson>(&c)) {
    j["person_id"] = p->person_id;
    j["group_id"] = p->group_id;
    put_sessions(j, p->sessions);
  } else if (auto p = std::get_if<MustStayTogether>(&c)) {
    j["people"] = p->people;
    put_sessions(j, p->sessions);
  } else if (auto p = std::get_if<ShouldStayTogether>(&c)) {
    j["people"] = p->people;
    j["penalty_weight"] = p->penalty_weight;
    put_sessions(j, p->sessions);
  } else if (auto p = std::get_if<ShouldNotBeTogether>(&c)) {
    j["people"] = p->people;
    j["penalty_weight"] = p->penalty_weight;
    put_sessions(j, p->sessions);
  } else if (auto p = std::get_if<PairMeetingCount>(&c)) {
    j["people"] = pair_json(p->people);
    j["target_meetings"] = p->target_meetings;
    j["mode"] = to_string(p->mode);
    j["penalty_weight"] = p->penalty_weight;
    put_sessions(j, p->sessions);
  }
  return j;
}

json problem_to_json(const Problem& p) {
  json j;
  j["num_sessions"] = p.num_sessions;
  j["people"] = json::array();
  for (const auto& person : p.people) {
    json pj = {{"id", person.id}, {"attributes", person.attributes}};
    put_sessions(pj, person.allowed_sessions);
    j["people"].push_back(std::move(pj));
  }
  j["groups"] = json::array();
  for (const auto& g : p.groups) j["groups"].push_back({{"id", g.id}, {"size", g.capacity}});
  j["constraints"] = json::array();
  for (const auto& c : p.constraints) j["constraints"].push_back(constraint_to_json(c));
  return j;
}

json schedule_to_json(const Schedule& s) {
  json out = json::array();
  for (const auto& a : s)
    out.push_back({{"person_id", a.person_id}, {"group_id", a.group_id}, {"session_id", a.session_id}});
  return out;
}

json score_to_json(const ScoreSummary& s) {
  return {
    {"final_score", s.final_score},
    {"unique_contacts", s.unique_contacts},
    {"repetition_penalty", s.repetition_penalty},
    {"attribute_balance_penalty", s.attribute_balance_penalty},
    {"constraint_penalty", s.constraint_penalty}
  };
}

namespace {

struct DetailJsonVisitor {
  json operator()(const RepeatEncounterDetail& d) const {
    return {{"kind", "RepeatEncounter"}, {"pair", pair_json(d.pair)}, {"count", d.count},
            {"maxAllowed", d.max_allowed}, {"sessions", d.sessions}};
  }
  json operator()(const AttributeBalanceDetail& d) const {
    return {{"kind", "AttributeBalance"}, {"session", d.session}, {"groupId", d.group_id},
            {"attribute", d.attribute_value}, {"desired", d.desired}, {"actual", d.actual}};
  }
  json operator()(const ImmovableDetail& d) const {
    return {{"kind", "Immovable"}, {"session", d.session}, {"personId", d.person_id},
            {"requiredGroup", d.required_group}, {"assignedGroup", optional_group(d.assigned_group)}};
  }
  json operator()(const TogetherSplitDetail& d) const {
    json people = json::array();
    for (const auto& p : d.people)
      people.push_back({{"personId", p.person_id}, {"groupId", optional_group(p.group_id)}});
    return {{"kind", "TogetherSplit"}, {"session", d.session}, {"people", people}};
  }
  json operator()(const NotTogetherDetail& d) const {
    return {{"kind", "NotTogether"}, {"session", d.session}, {"groupId", d.group_id}, {"people", d.people}};
  }
  json operator()(const PairMeetingSummaryDetail& d) const {
    return {{"kind", "PairMeetingCountSummary"}, {"people", pair_json(d.people)}, {"target", d.target},
            {"actual", d.actual}, {"mode", to_string(d.mode)}, {"sessions", d.sessions}};
  }
  json operator()(const PairMeetingTogetherDetail& d) const {
    return {{"kind", "PairMeetingTogether"}, {"session", d.session}, {"people", pair_json(d.people)},
            {"groupId", optional_group(d.group_id)}};
  }
  json operator()(const PairMeetingApartDetail& d) const {
    return {{"kind", "PairMeetingApart"}, {"session", d.session}, {"people", pair_json(d.people)},
            {"groupId", optional_group(d.group_id)}};
  }
};

} // namespace

json detail_to_json(const ViolationDetail& d) {
  return std::visit(DetailJsonVisitor{}, d);
}

static json details_json(const std::vector<ViolationDetail>& details) {
  json arr = json::array();
  for (const auto& d : details) arr.push_back(detail_to_json(d));
  return arr;
}

json result_to_json(const ComplianceResult& r) {
  json j;
  j["constraintIndex"] = r.constraint_index;
  j["type"] = r.type;
  j["title"] = r.title;
  j["subtitle"] = r.subtitle;
  j["isHard"] = r.is_hard;
  j["recognized"] = r.recognized;
  j["penaltyWeight"] = r.penalty_weight;
  j["adheres"] = r.adheres;
  j["violationsCount"] = r.violations_count;
  j["details"] = details_json(r.details);
  return j;
}

json report_to_json(const ComplianceReport& report) {
  json out = json::array();
  for (const auto& r : report) out.push_back(result_to_json(r));
  return out;
}

json change_report_to_json(const ChangeReport& report) {
  json j;
  j["before_score"] = score_to_json(report.before_score);
  j["after_score"] = score_to_json(report.after_score);
  j["score_delta"] = score_to_json(report.score_delta);
  j["aggregateScoreDelta"] = report.aggregate_score_delta;
  j["perConstraintDelta"] = json::array();
  for (const auto& d : report.per_constraint_delta) {
    j["perConstraintDelta"].push_back({
      {"constraintIndex", d.constraint_index},
      {"type", d.type},
      {"isHard", d.is_hard},
      {"changed", d.changed},
      {"surfaced", d.surfaced},
      {"beforeCount", d.before_count},
      {"afterCount", d.after_count},
      {"beforeAdheres", d.before_adheres},
      {"afterAdheres", d.after_adheres},
      {"addedDetails", details_json(d.added_details)},
      {"removedDetails", details_json(d.removed_details)},
      {"weightedDelta", d.weighted_delta}
    });
  }
  return j;
}

} // namespace gc
