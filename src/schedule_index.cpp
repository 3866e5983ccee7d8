#include "schedule_index.h"
#include <algorithm>

namespace gc {

namespace {
const std::vector<GroupMembers> kNoGroups;
const std::vector<std::string> kNoPeople;
}

ScheduleIndex::ScheduleIndex(const Schedule& assignments, int num_sessions)
    : num_sessions_(std::max(0, num_sessions)) {
  for (const auto& a : assignments) {
    SessionGroups& sg = by_session_[a.session_id];
    auto it = sg.slot.find(a.group_id);
    if (it == sg.slot.end()) {
      it = sg.slot.emplace(a.group_id, sg.groups.size()).first;
      sg.groups.push_back(GroupMembers{a.group_id, {}});
    }
    sg.groups[it->second].people.push_back(a.person_id);
    by_person_[a.person_id][a.session_id] = a.group_id;
  }
}

const std::vector<GroupMembers>& ScheduleIndex::groups_in(int session) const {
  auto it = by_session_.find(session);
  if (it == by_session_.end()) return kNoGroups;
  return it->second.groups;
}

const std::vector<std::string>& ScheduleIndex::members(int session, const std::string& group_id) const {
  auto it = by_session_.find(session);
  if (it == by_session_.end()) return kNoPeople;
  auto gt = it->second.slot.find(group_id);
  if (gt == it->second.slot.end()) return kNoPeople;
  return it->second.groups[gt->second].people;
}

bool ScheduleIndex::is_member(int session, const std::string& group_id, const std::string& person_id) const {
  const auto& people = members(session, group_id);
  return std::find(people.begin(), people.end(), person_id) != people.end();
}

std::optional<std::string> ScheduleIndex::group_of(const std::string& person_id, int session) const {
  auto it = by_person_.find(person_id);
  if (it == by_person_.end()) return std::nullopt;
  auto st = it->second.find(session);
  if (st == it->second.end()) return std::nullopt;
  return st->second;
}

std::vector<int> ScheduleIndex::sessions_present() const {
  std::vector<int> out;
  out.reserve(by_session_.size());
  for (const auto& kv : by_session_) out.push_back(kv.first);
  return out;
}

std::vector<int> ScheduleIndex::all_sessions() const {
  std::vector<int> out(num_sessions_);
  for (int s = 0; s < num_sessions_; ++s) out[s] = s;
  return out;
}

std::vector<int> ScheduleIndex::select(const SessionSet& sessions, bool empty_means_all) const {
  if (!sessions) return all_sessions();
  if (sessions->empty() && empty_means_all) return all_sessions();
  return *sessions;
}

} // namespace gc
