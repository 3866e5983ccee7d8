// evaluators.h
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"
#include "schedule_index.h"

namespace gc {

// Bucket used for people lacking the balanced attribute (or unknown people).
inline const std::string kUnknownAttributeValue = "__UNKNOWN__";

using PersonIndex = std::unordered_map<std::string, const Person*>;

PersonIndex build_person_index(const std::vector<Person>& people);

// Attribute value of a person, or kUnknownAttributeValue.
const std::string& attribute_of(const PersonIndex& people,
                                const std::string& person_id,
                                const std::string& key);

// Each evaluator fills adheres, violations_count and details only; the report
// builder stamps index, type, title and weight.

ComplianceResult evaluate_repeat_encounter(const RepeatEncounter& c,
                                           const ScheduleIndex& idx);

ComplianceResult evaluate_attribute_balance(const AttributeBalance& c,
                                            const ScheduleIndex& idx,
                                            const PersonIndex& people);

ComplianceResult evaluate_immovable(const std::vector<std::string>& people,
                                    const std::string& group_id,
                                    const SessionSet& sessions,
                                    const ScheduleIndex& idx);

ComplianceResult evaluate_stay_together(const std::vector<std::string>& people,
                                        const SessionSet& sessions,
                                        const ScheduleIndex& idx);

ComplianceResult evaluate_not_together(const ShouldNotBeTogether& c,
                                       const ScheduleIndex& idx);

ComplianceResult evaluate_pair_meeting_count(const PairMeetingCount& c,
                                             const ScheduleIndex& idx);

// Dispatch on the constraint tag. Unknown tags yield a satisfied, empty result
// with recognized == false.
ComplianceResult evaluate_constraint(const Constraint& c,
                                     const ScheduleIndex& idx,
                                     const PersonIndex& people);

} // namespace gc
