// change_report.cpp
#include "change_report.h"
#include "detail_key.h"

#include <algorithm>
#include <unordered_set>

namespace gc {

static void check_alignment(const ComplianceReport& before, const ComplianceReport& after) {
  if (before.size() != after.size())
    throw ReportMismatchError("Change report needs reports of equal length: before has " +
                              std::to_string(before.size()) + " constraints, after has " +
                              std::to_string(after.size()) + ".");
  for (size_t i = 0; i < before.size(); ++i) {
    if (before[i].constraint_index != after[i].constraint_index || before[i].type != after[i].type)
      throw ReportMismatchError("Constraint #" + std::to_string(i) + " differs between reports (" +
                                before[i].type + " vs " + after[i].type + ").");
  }
}

static ConstraintDelta diff_one(const ComplianceResult& before, const ComplianceResult& after) {
  ConstraintDelta d;
  d.constraint_index = after.constraint_index;
  d.type = after.type;
  d.is_hard = after.is_hard;
  d.before_count = before.violations_count;
  d.after_count = after.violations_count;
  d.before_adheres = before.adheres;
  d.after_adheres = after.adheres;

  std::unordered_set<std::string> before_keys;
  for (const auto& det : before.details) before_keys.insert(detail_key(det));

  std::unordered_set<std::string> after_keys;
  for (const auto& det : after.details) {
    std::string k = detail_key(det);
    if (!after_keys.insert(k).second) continue;
    if (!before_keys.count(k)) d.added_details.push_back(det);
  }
  std::unordered_set<std::string> removed_keys;
  for (const auto& det : before.details) {
    std::string k = detail_key(det);
    if (!after_keys.count(k) && removed_keys.insert(k).second) d.removed_details.push_back(det);
  }

  // A count can move while the offending tuples stay the same.
  d.changed = d.before_count != d.after_count || !d.added_details.empty() || !d.removed_details.empty();
  d.weighted_delta = static_cast<double>(d.after_count - d.before_count) * after.penalty_weight;
  d.surfaced = d.is_hard ? (d.changed || !d.before_adheres || !d.after_adheres) : d.changed;
  return d;
}

ScoreSummary score_difference(const ScoreSummary& before, const ScoreSummary& after) {
  ScoreSummary s;
  s.final_score = after.final_score - before.final_score;
  s.unique_contacts = after.unique_contacts - before.unique_contacts;
  s.repetition_penalty = after.repetition_penalty - before.repetition_penalty;
  s.attribute_balance_penalty = after.attribute_balance_penalty - before.attribute_balance_penalty;
  s.constraint_penalty = after.constraint_penalty - before.constraint_penalty;
  return s;
}

ChangeReport build_change_report(const ComplianceReport& before,
                                 const ComplianceReport& after,
                                 const ScoreSummary& before_score,
                                 const ScoreSummary& after_score) {
  check_alignment(before, after);

  ChangeReport out;
  out.before_score = before_score;
  out.after_score = after_score;
  out.score_delta = score_difference(before_score, after_score);
  out.per_constraint_delta.reserve(after.size());
  for (size_t i = 0; i < after.size(); ++i) {
    out.per_constraint_delta.push_back(diff_one(before[i], after[i]));
    out.aggregate_score_delta += out.per_constraint_delta.back().weighted_delta;
  }

  // Hard constraints first; constraint order within each class.
  std::stable_partition(out.per_constraint_delta.begin(), out.per_constraint_delta.end(),
                        [](const ConstraintDelta& d) { return d.is_hard; });
  return out;
}

std::vector<const ConstraintDelta*> surfaced_deltas(const ChangeReport& report) {
  std::vector<const ConstraintDelta*> out;
  for (const auto& d : report.per_constraint_delta)
    if (d.surfaced) out.push_back(&d);
  return out;
}

} // namespace gc
