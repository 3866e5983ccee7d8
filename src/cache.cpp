#include "cache.h"
#include "problem_io.h"
#include <algorithm>

namespace gc {

// FNV-1a 64-bit
static void fnv1a(uint64_t& h, const std::string& s) {
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ull;
  }
}

static constexpr uint64_t kFnvOffset = 1469598103934665603ull;

std::string ReportCache::kstr(const ReportCacheKey& k) {
  return std::to_string(k.problem_hash) + ":" + std::to_string(k.schedule_hash);
}

uint64_t ReportCache::hash_problem(const Problem& p) {
  // nlohmann::json objects are key-sorted, so the dump is canonical.
  uint64_t h = kFnvOffset;
  fnv1a(h, problem_to_json(p).dump());
  return h;
}

uint64_t ReportCache::hash_schedule(const Schedule& s) {
  // Record order matters: it fixes group and member order inside details.
  uint64_t h = kFnvOffset;
  fnv1a(h, schedule_to_json(s).dump());
  return h;
}

ReportCacheKey ReportCache::key_for(const Problem& p, const Schedule& s) {
  return ReportCacheKey{hash_problem(p), hash_schedule(s)};
}

bool ReportCache::get(const ReportCacheKey& k, ComplianceReport& out) {
  const std::string key = kstr(k);
  auto it = map.find(key);
  if (it == map.end()) return false;

  // Move the node to the front (MRU)
  order.splice(order.begin(), order, it->second.first);

  out = it->second.second;
  return true;
}

void ReportCache::put(const ReportCacheKey& k, const ComplianceReport& v) {
  if (capacity == 0) return;
  const std::string key = kstr(k);
  auto it = map.find(key);

  if (it != map.end()) {
    it->second.second = v;
    order.splice(order.begin(), order, it->second.first);
    return;
  }

  // Evict LRU if full
  if (map.size() >= capacity && !order.empty()) {
    const ReportCacheKey& lru_key = order.back();
    map.erase(kstr(lru_key));
    order.pop_back();
  }

  order.push_front(k);
  map.emplace(key, std::make_pair(order.begin(), v));
}

ComplianceReport ReportCache::get_or_build(const Problem& p, const Schedule& s, const BuildOptions& opts) {
  const ReportCacheKey k = key_for(p, s);
  ComplianceReport out;
  if (get(k, out)) {
    ++hits;
    return out;
  }
  ++misses;
  out = build_compliance_report(p, s, opts);
  put(k, out);
  return out;
}

} // namespace gc
