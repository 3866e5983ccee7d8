// compliance.cpp
#include "compliance.h"
#include "detail_key.h"
#include "evaluators.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace gc {

static std::string format_number(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

static std::string one_based_list(const std::vector<int>& sessions) {
  std::ostringstream os;
  for (size_t i = 0; i < sessions.size(); ++i) {
    if (i) os << ", ";
    os << sessions[i] + 1;
  }
  return os.str();
}

std::string format_sessions(const SessionSet& sessions, int total) {
  if (!sessions || sessions->empty()) return "All sessions";
  if (static_cast<int>(sessions->size()) == total) return "All sessions";
  return "Sessions " + one_based_list(*sessions);
}

namespace {

struct DescribeVisitor {
  int num_sessions;
  using Card = std::pair<std::string, std::string>;

  Card operator()(const RepeatEncounter& c) const {
    return {"Repeat Encounter (max " + std::to_string(c.max_allowed_encounters) + ")",
            "Penalty: " + to_string(c.penalty_function) + ", Weight: " + format_number(c.penalty_weight)};
  }
  Card operator()(const AttributeBalance& c) const {
    std::string sub = format_sessions(c.sessions, num_sessions) + " • Weight: " + format_number(c.penalty_weight);
    if (c.mode == BalanceMode::AtLeast) sub += " • Mode: At least";
    return {"Attribute Balance – " + c.group_id + " (" + c.attribute_key + ")", sub};
  }
  Card operator()(const ImmovablePeople& c) const {
    return {"Immovable People", format_sessions(c.sessions, num_sessions) + " • Group: " + c.group_id};
  }
  Card operator()(const ImmovablePerson& c) const {
    return {"Immovable Person", format_sessions(c.sessions, num_sessions) + " • Group: " + c.group_id};
  }
  Card operator()(const MustStayTogether& c) const {
    return {"Must Stay Together", format_sessions(c.sessions, num_sessions)};
  }
  Card operator()(const ShouldStayTogether& c) const {
    return {"Should Stay Together",
            format_sessions(c.sessions, num_sessions) + " • Weight: " + format_number(c.penalty_weight)};
  }
  Card operator()(const ShouldNotBeTogether& c) const {
    return {"Should Not Be Together",
            format_sessions(c.sessions, num_sessions) + " • Weight: " + format_number(c.penalty_weight)};
  }
  Card operator()(const PairMeetingCount& c) const {
    std::string mode = to_string(c.mode);
    std::replace(mode.begin(), mode.end(), '_', ' ');
    return {"Pair Meeting Count (" + mode + ")",
            format_sessions(c.sessions, num_sessions) + " • Target: " + std::to_string(c.target_meetings)};
  }
  Card operator()(const UnknownConstraint& c) const {
    return {c.type_name, "Unknown constraint type, assumed satisfied"};
  }
};

std::string group_or_unassigned(const std::optional<std::string>& g) {
  return g ? *g : std::string("unassigned");
}

struct DetailTextVisitor {
  std::string operator()(const RepeatEncounterDetail& d) const {
    std::ostringstream os;
    os << d.pair.first << " <-> " << d.pair.second << " together " << d.count
       << "x (max " << d.max_allowed << ") in sessions " << one_based_list(d.sessions);
    return os.str();
  }
  std::string operator()(const AttributeBalanceDetail& d) const {
    std::ostringstream os;
    os << "Session " << d.session + 1 << ", group " << d.group_id << ": value \""
       << d.attribute_value << "\" desired " << d.desired << ", actual " << d.actual;
    return os.str();
  }
  std::string operator()(const ImmovableDetail& d) const {
    std::ostringstream os;
    os << "Session " << d.session + 1 << ": " << d.person_id << " must be in " << d.required_group
       << " (" << (d.assigned_group ? "assigned to " + *d.assigned_group : std::string("not assigned")) << ")";
    return os.str();
  }
  std::string operator()(const TogetherSplitDetail& d) const {
    std::ostringstream os;
    os << "Session " << d.session + 1 << " split:";
    for (size_t i = 0; i < d.people.size(); ++i)
      os << (i ? ", " : " ") << d.people[i].person_id << " -> " << group_or_unassigned(d.people[i].group_id);
    return os.str();
  }
  std::string operator()(const NotTogetherDetail& d) const {
    std::ostringstream os;
    os << "Session " << d.session + 1 << ", group " << d.group_id << ":";
    for (size_t i = 0; i < d.people.size(); ++i) os << (i ? ", " : " ") << d.people[i];
    os << " together";
    return os.str();
  }
  std::string operator()(const PairMeetingSummaryDetail& d) const {
    std::ostringstream os;
    os << d.people.first << " <-> " << d.people.second << " met " << d.actual << " time(s), target "
       << to_string(d.mode) << " " << d.target << " over sessions " << one_based_list(d.sessions);
    return os.str();
  }
  std::string operator()(const PairMeetingTogetherDetail& d) const {
    return "Session " + std::to_string(d.session + 1) + ": " + d.people.first + " <-> " +
           d.people.second + " together in " + group_or_unassigned(d.group_id);
  }
  std::string operator()(const PairMeetingApartDetail& d) const {
    return "Session " + std::to_string(d.session + 1) + ": " + d.people.first + " <-> " +
           d.people.second + " apart";
  }
};

} // namespace

std::pair<std::string, std::string> describe_constraint(const Constraint& c, int num_sessions) {
  return std::visit(DescribeVisitor{num_sessions}, c);
}

std::string describe_detail(const ViolationDetail& d) {
  return std::visit(DetailTextVisitor{}, d);
}

static ComplianceResult evaluate_at(const Problem& problem,
                                    const ScheduleIndex& idx,
                                    const PersonIndex& people,
                                    int index) {
  const Constraint& c = problem.constraints[index];
  ComplianceResult r = evaluate_constraint(c, idx, people);
  r.details = dedupe_details(std::move(r.details));
  r.constraint_index = index;
  r.type = constraint_type_name(c);
  r.is_hard = is_hard(c);
  r.penalty_weight = penalty_weight_of(c);
  auto card = describe_constraint(c, problem.num_sessions);
  r.title = std::move(card.first);
  r.subtitle = std::move(card.second);
  return r;
}

ComplianceReport build_compliance_report(const Problem& problem,
                                         const ScheduleIndex& idx,
                                         const BuildOptions& opts) {
  const int n = static_cast<int>(problem.constraints.size());
  const PersonIndex people = build_person_index(problem.people);
  ComplianceReport report(n);

  const int workers = std::max(1, std::min(opts.threads, n));
  if (workers <= 1) {
    for (int i = 0; i < n; ++i) report[i] = evaluate_at(problem, idx, people, i);
  } else {
    // Each worker writes only its own claimed slots.
    std::atomic<int> next_idx{0};
    std::vector<std::future<void>> pool;
    pool.reserve(workers);
    for (int t = 0; t < workers; ++t) {
      pool.emplace_back(std::async(std::launch::async, [&]() {
        for (;;) {
          int i = next_idx.fetch_add(1);
          if (i >= n) break;
          report[i] = evaluate_at(problem, idx, people, i);
        }
      }));
    }
    for (auto& fut : pool) fut.get();
  }

  if (opts.verbose) {
    for (const auto& r : report) {
      if (!r.recognized)
        std::cerr << "[warn] constraint #" << r.constraint_index << " has unknown type '" << r.type
                  << "'; assumed satisfied\n";
    }
  }
  return report;
}

ComplianceReport build_compliance_report(const Problem& problem,
                                         const Schedule& schedule,
                                         const BuildOptions& opts) {
  const ScheduleIndex idx(schedule, problem.num_sessions);
  return build_compliance_report(problem, idx, opts);
}

int count_violated(const ComplianceReport& report) {
  return static_cast<int>(std::count_if(report.begin(), report.end(),
                                        [](const ComplianceResult& r) { return !r.adheres; }));
}

ContactStats compute_unique_contacts(const ScheduleIndex& idx, int people_count) {
  std::unordered_set<std::string> seen;
  for (int session : idx.sessions_present()) {
    for (const auto& g : idx.groups_in(session)) {
      const auto& ids = g.people;
      for (size_t i = 0; i < ids.size(); ++i) for (size_t j = i + 1; j < ids.size(); ++j) {
        if (ids[i] == ids[j]) continue;
        seen.insert(ids[i] < ids[j] ? ids[i] + "|" + ids[j] : ids[j] + "|" + ids[i]);
      }
    }
  }
  ContactStats s;
  s.unique_contacts = static_cast<int>(seen.size());
  s.avg_unique_contacts = (s.unique_contacts * 2.0) / std::max(1, people_count);
  return s;
}

} // namespace gc
