// cache.h
#pragma once
#include "types.h"
#include "compliance.h"
#include <cstdint>
#include <list>
#include <string>
#include <unordered_map>

namespace gc {

struct ReportCacheKey {
  uint64_t problem_hash;
  uint64_t schedule_hash;
  bool operator==(const ReportCacheKey& o) const {
    return problem_hash == o.problem_hash && schedule_hash == o.schedule_hash;
  }
};

// LRU memo of compliance reports keyed by problem and schedule content.
struct ReportCache {
  size_t capacity = 64;

  std::list<ReportCacheKey> order;
  using ListIt = std::list<ReportCacheKey>::iterator;

  std::unordered_map<std::string, std::pair<ListIt, ComplianceReport>> map;

  int hits = 0;
  int misses = 0;

  static std::string kstr(const ReportCacheKey& k);
  static uint64_t hash_problem(const Problem& p);
  static uint64_t hash_schedule(const Schedule& s);
  static ReportCacheKey key_for(const Problem& p, const Schedule& s);

  bool get(const ReportCacheKey& k, ComplianceReport& out);
  void put(const ReportCacheKey& k, const ComplianceReport& v);

  // Cached report, or a freshly built one that is stored before returning.
  ComplianceReport get_or_build(const Problem& p, const Schedule& s, const BuildOptions& opts = {});
};

} // namespace gc
