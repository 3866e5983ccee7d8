// detail_key.h
#pragma once
#include <string>
#include <vector>
#include "types.h"

namespace gc {

// Canonical identity of a violation detail. Two details are the same finding
// iff their keys match. Array order never matters, and fields that are being
// diffed (encounter counts, actual head counts) are left out.
std::string detail_key(const ViolationDetail& d);

// Drops details whose key already occurred earlier in the list.
std::vector<ViolationDetail> dedupe_details(std::vector<ViolationDetail> details);

} // namespace gc
