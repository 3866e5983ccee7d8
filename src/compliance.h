// compliance.h
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "types.h"
#include "schedule_index.h"

namespace gc {

struct BuildOptions {
  int threads = 1;        // >1 evaluates constraints concurrently
  bool verbose = false;   // warn on stderr about unknown constraint types
};

// Evaluate every constraint of the problem against one schedule. The result
// has exactly problem.constraints.size() entries, entry i for constraint i.
ComplianceReport build_compliance_report(const Problem& problem,
                                         const Schedule& schedule,
                                         const BuildOptions& opts = {});

ComplianceReport build_compliance_report(const Problem& problem,
                                         const ScheduleIndex& idx,
                                         const BuildOptions& opts = {});

// Number of results with adheres == false.
int count_violated(const ComplianceReport& report);

// ---- Display helpers ----

// "All sessions" or "Sessions 1, 3" (one-based).
std::string format_sessions(const SessionSet& sessions, int total);

// Card title and subtitle shown next to a constraint's result.
std::pair<std::string, std::string> describe_constraint(const Constraint& c, int num_sessions);

// One line of human-readable text for a detail, using ids as names.
std::string describe_detail(const ViolationDetail& d);

struct ContactStats {
  int unique_contacts = 0;
  double avg_unique_contacts = 0.0;   // 2 * unique / max(1, people)
};

// Distinct unordered pairs that share a group in at least one session.
ContactStats compute_unique_contacts(const ScheduleIndex& idx, int people_count);

} // namespace gc
