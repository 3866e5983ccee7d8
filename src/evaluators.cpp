// evaluators.cpp
#include "evaluators.h"
#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>
#include <unordered_set>

namespace gc {

PersonIndex build_person_index(const std::vector<Person>& people) {
  PersonIndex out;
  out.reserve(people.size() * 2);
  for (const auto& p : people) out[p.id] = &p;
  return out;
}

const std::string& attribute_of(const PersonIndex& people,
                                const std::string& person_id,
                                const std::string& key) {
  auto it = people.find(person_id);
  if (it == people.end() || it->second == nullptr) return kUnknownAttributeValue;
  auto at = it->second->attributes.find(key);
  if (at == it->second->attributes.end()) return kUnknownAttributeValue;
  return at->second;
}

static PersonPair sorted_pair(const std::string& a, const std::string& b) {
  return a < b ? PersonPair{a, b} : PersonPair{b, a};
}

static void finish(ComplianceResult& r, int violations) {
  r.violations_count = violations;
  r.adheres = violations == 0;
}

ComplianceResult evaluate_repeat_encounter(const RepeatEncounter& c,
                                           const ScheduleIndex& idx) {
  struct PairEntry {
    int count = 0;
    std::set<int> sessions;
  };
  // Ordered by pair so details come out in a stable order.
  std::map<PersonPair, PairEntry> pairs;

  for (int session : idx.sessions_present()) {
    for (const auto& g : idx.groups_in(session)) {
      const auto& ids = g.people;
      for (size_t i = 0; i < ids.size(); ++i) for (size_t j = i + 1; j < ids.size(); ++j) {
        if (ids[i] == ids[j]) continue;
        PairEntry& e = pairs[sorted_pair(ids[i], ids[j])];
        e.count += 1;
        e.sessions.insert(session);
      }
    }
  }

  ComplianceResult r;
  int violations = 0;
  for (auto& [pair, entry] : pairs) {
    if (entry.count <= c.max_allowed_encounters) continue;
    violations += entry.count - c.max_allowed_encounters;
    RepeatEncounterDetail d;
    d.pair = pair;
    d.count = entry.count;
    d.max_allowed = c.max_allowed_encounters;
    d.sessions.assign(entry.sessions.begin(), entry.sessions.end());
    r.details.emplace_back(std::move(d));
  }
  finish(r, violations);
  return r;
}

ComplianceResult evaluate_attribute_balance(const AttributeBalance& c,
                                            const ScheduleIndex& idx,
                                            const PersonIndex& people) {
  ComplianceResult r;
  int violations = 0;
  for (int session : idx.select(c.sessions)) {
    std::map<std::string, int> counts;
    for (const auto& pid : idx.members(session, c.group_id))
      counts[attribute_of(people, pid, c.attribute_key)] += 1;

    // Values missing from desired_values are unconstrained.
    for (const auto& [value, desired] : c.desired_values) {
      auto it = counts.find(value);
      const int actual = (it == counts.end()) ? 0 : it->second;
      const int deficit = (c.mode == BalanceMode::AtLeast)
                              ? std::max(0, desired - actual)
                              : std::abs(actual - desired);
      if (deficit == 0) continue;
      violations += deficit;
      r.details.emplace_back(AttributeBalanceDetail{session, c.group_id, value, desired, actual});
    }
  }
  finish(r, violations);
  return r;
}

ComplianceResult evaluate_immovable(const std::vector<std::string>& people,
                                    const std::string& group_id,
                                    const SessionSet& sessions,
                                    const ScheduleIndex& idx) {
  ComplianceResult r;
  int violations = 0;
  for (int session : idx.select(sessions)) {
    for (const auto& pid : people) {
      if (idx.is_member(session, group_id, pid)) continue;
      violations += 1;
      r.details.emplace_back(ImmovableDetail{session, pid, group_id, idx.group_of(pid, session)});
    }
  }
  finish(r, violations);
  return r;
}

ComplianceResult evaluate_stay_together(const std::vector<std::string>& people,
                                        const SessionSet& sessions,
                                        const ScheduleIndex& idx) {
  ComplianceResult r;
  int violations = 0;
  for (int session : idx.select(sessions)) {
    TogetherSplitDetail d;
    d.session = session;
    std::set<std::string> used;
    int unassigned = 0;
    for (const auto& pid : people) {
      auto gid = idx.group_of(pid, session);
      if (gid) used.insert(*gid);
      else unassigned += 1;
      d.people.push_back(PersonPlacement{pid, std::move(gid)});
    }
    const int k = static_cast<int>(used.size());
    const int splits = std::max(0, k - 1);
    if (splits == 0 && unassigned == 0) continue;
    violations += unassigned + splits;
    r.details.emplace_back(std::move(d));
  }
  finish(r, violations);
  return r;
}

ComplianceResult evaluate_not_together(const ShouldNotBeTogether& c,
                                       const ScheduleIndex& idx) {
  const std::unordered_set<std::string> constrained(c.people.begin(), c.people.end());
  ComplianceResult r;
  int violations = 0;
  for (int session : idx.select(c.sessions)) {
    for (const auto& g : idx.groups_in(session)) {
      std::vector<std::string> involved;
      for (const auto& pid : g.people)
        if (constrained.count(pid)) involved.push_back(pid);
      const int m = static_cast<int>(involved.size());
      if (m <= 1) continue;
      violations += m - 1;
      r.details.emplace_back(NotTogetherDetail{session, g.group_id, std::move(involved)});
    }
  }
  finish(r, violations);
  return r;
}

ComplianceResult evaluate_pair_meeting_count(const PairMeetingCount& c,
                                             const ScheduleIndex& idx) {
  const std::string& a = c.people.first;
  const std::string& b = c.people.second;
  const std::vector<int> subset = idx.select(c.sessions, /*empty_means_all=*/true);

  ComplianceResult r;
  std::vector<ViolationDetail> per_session;
  per_session.reserve(subset.size());
  int actual = 0;
  for (int session : subset) {
    std::optional<std::string> shared;
    for (const auto& g : idx.groups_in(session)) {
      const auto& ids = g.people;
      if (std::find(ids.begin(), ids.end(), a) != ids.end() &&
          std::find(ids.begin(), ids.end(), b) != ids.end()) {
        shared = g.group_id;
        break;
      }
    }
    if (shared) {
      actual += 1;
      per_session.emplace_back(PairMeetingTogetherDetail{session, c.people, shared});
    } else {
      per_session.emplace_back(PairMeetingApartDetail{session, c.people, std::nullopt});
    }
  }

  int deviation = 0;
  switch (c.mode) {
    case MeetingMode::AtLeast: deviation = std::max(0, c.target_meetings - actual); break;
    case MeetingMode::Exact:   deviation = std::abs(c.target_meetings - actual); break;
    case MeetingMode::AtMost:  deviation = std::max(0, actual - c.target_meetings); break;
  }

  // Summary first, then one narrative entry per selected session, always.
  r.details.emplace_back(PairMeetingSummaryDetail{c.people, c.target_meetings, actual, c.mode, subset});
  for (auto& d : per_session) r.details.push_back(std::move(d));
  finish(r, deviation);
  return r;
}

namespace {

struct EvaluateVisitor {
  const ScheduleIndex& idx;
  const PersonIndex& people;

  ComplianceResult operator()(const RepeatEncounter& c) const {
    return evaluate_repeat_encounter(c, idx);
  }
  ComplianceResult operator()(const AttributeBalance& c) const {
    return evaluate_attribute_balance(c, idx, people);
  }
  ComplianceResult operator()(const ImmovablePeople& c) const {
    return evaluate_immovable(c.people, c.group_id, c.sessions, idx);
  }
  ComplianceResult operator()(const ImmovablePerson& c) const {
    return evaluate_immovable({c.person_id}, c.group_id, c.sessions, idx);
  }
  ComplianceResult operator()(const MustStayTogether& c) const {
    return evaluate_stay_together(c.people, c.sessions, idx);
  }
  ComplianceResult operator()(const ShouldStayTogether& c) const {
    return evaluate_stay_together(c.people, c.sessions, idx);
  }
  ComplianceResult operator()(const ShouldNotBeTogether& c) const {
    return evaluate_not_together(c, idx);
  }
  ComplianceResult operator()(const PairMeetingCount& c) const {
    return evaluate_pair_meeting_count(c, idx);
  }
  ComplianceResult operator()(const UnknownConstraint&) const {
    ComplianceResult r;
    r.recognized = false;
    return r;
  }
};

} // namespace

ComplianceResult evaluate_constraint(const Constraint& c,
                                     const ScheduleIndex& idx,
                                     const PersonIndex& people) {
  return std::visit(EvaluateVisitor{idx, people}, c);
}

} // namespace gc
