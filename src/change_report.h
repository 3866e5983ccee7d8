// change_report.h
#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "types.h"

namespace gc {

// Before/after reports do not describe the same constraint list.
class ReportMismatchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ConstraintDelta {
  int constraint_index = 0;
  std::string type;
  bool is_hard = false;
  bool changed = false;     // count moved or the finding set moved
  bool surfaced = false;    // shown in the confirmation view
  int before_count = 0;
  int after_count = 0;
  bool before_adheres = true;
  bool after_adheres = true;
  std::vector<ViolationDetail> added_details;     // after order
  std::vector<ViolationDetail> removed_details;   // before order
  double weighted_delta = 0.0;                    // (after - before) * weight
};

struct ChangeReport {
  ScoreSummary before_score;
  ScoreSummary after_score;
  ScoreSummary score_delta;                        // after - before, field by field
  std::vector<ConstraintDelta> per_constraint_delta;   // hard first, then soft
  double aggregate_score_delta = 0.0;
};

// Diff two reports of the same problem evaluated against different schedules.
// Throws ReportMismatchError when lengths or per-index types differ.
ChangeReport build_change_report(const ComplianceReport& before,
                                 const ComplianceReport& after,
                                 const ScoreSummary& before_score = {},
                                 const ScoreSummary& after_score = {});

// Entries flagged surfaced, in report order.
std::vector<const ConstraintDelta*> surfaced_deltas(const ChangeReport& report);

ScoreSummary score_difference(const ScoreSummary& before, const ScoreSummary& after);

} // namespace gc
