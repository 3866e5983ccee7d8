// problem_io.h
#pragma once
#include <nlohmann/json.hpp>
#include "types.h"
#include "change_report.h"

namespace gc {

using json = nlohmann::json;

// ---- Decoding ----
// Missing or mistyped required fields throw std::runtime_error naming the field.

// Accepts {"people", "groups", "num_sessions", "constraints"} or the solver's
// input envelope {"problem": {...}, "constraints": [...]}.
Problem parse_problem(const json& j);

// Tag in "type"; unrecognised tags become UnknownConstraint.
Constraint parse_constraint(const json& j);

// Accepts a Solution object ({"assignments": [...], "final_score": ...}) or a
// bare array of assignment records.
Solution parse_solution(const json& j);

ScoreSummary parse_score_summary(const json& j);

// ---- Encoding ----

json constraint_to_json(const Constraint& c);
json problem_to_json(const Problem& p);
json schedule_to_json(const Schedule& s);
json score_to_json(const ScoreSummary& s);
json detail_to_json(const ViolationDetail& d);
json result_to_json(const ComplianceResult& r);
json report_to_json(const ComplianceReport& report);
json change_report_to_json(const ChangeReport& report);

} // namespace gc
