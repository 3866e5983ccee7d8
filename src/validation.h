// validation.h
#pragma once
#include <string>
#include <vector>
#include <stdexcept>

#include "types.h"

namespace gc {

// ---- Structural problem checks (throw std::runtime_error) ----

// Runs every check below.
void validate_problem(const Problem& problem);

void validate_people(const std::vector<Person>& people);
void validate_groups(const std::vector<Group>& groups);
void validate_session_count(int num_sessions);
void validate_constraint_parameters(const std::vector<Constraint>& constraints);

// ---- Soft checks (never throw; one message per finding) ----
//
// The evaluator reports dangling references as violations, so these are
// only surfaced as warnings to whoever prepared the input.

// Constraints referencing unknown people/groups, out-of-range sessions or
// unrecognised types.
std::vector<std::string> check_constraint_references(const Problem& problem);

// Assignments referencing unknown people/groups, out-of-range sessions, or a
// person placed in more than one group in the same session.
std::vector<std::string> check_schedule(const Problem& problem, const Schedule& schedule);

} // namespace gc
