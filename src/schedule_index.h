// schedule_index.h
#pragma once
#include "types.h"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gc {

struct GroupMembers {
  std::string group_id;
  std::vector<std::string> people;   // record order
};

// Read-only lookup structure over one schedule.
//
// Both maps are built in the constructor, so concurrent readers need no
// locking. Capacity and the "one group per person per session" rule are not
// checked, so callers scan raw membership wherever that matters.
class ScheduleIndex {
public:
  ScheduleIndex(const Schedule& assignments, int num_sessions);

  ScheduleIndex(const ScheduleIndex&) = delete;
  ScheduleIndex& operator=(const ScheduleIndex&) = delete;

  int num_sessions() const { return num_sessions_; }

  // Groups of a session in order of first appearance. Empty for unknown sessions.
  const std::vector<GroupMembers>& groups_in(int session) const;

  // Members of one group in one session, empty if none.
  const std::vector<std::string>& members(int session, const std::string& group_id) const;

  bool is_member(int session, const std::string& group_id, const std::string& person_id) const;

  // Group of a person in a session; the last assignment record wins when a
  // person is (invalidly) placed twice.
  std::optional<std::string> group_of(const std::string& person_id, int session) const;

  // Every session that has at least one record, ascending. May include
  // indices outside [0, num_sessions).
  std::vector<int> sessions_present() const;

  // [0, num_sessions)
  std::vector<int> all_sessions() const;

  // Resolve a constraint's session selection. When empty_means_all is set an
  // explicit empty list also selects every session.
  std::vector<int> select(const SessionSet& sessions, bool empty_means_all = false) const;

private:
  struct SessionGroups {
    std::vector<GroupMembers> groups;
    std::unordered_map<std::string, std::size_t> slot;   // group_id -> index in groups
  };

  int num_sessions_ = 0;
  std::map<int, SessionGroups> by_session_;

  // person -> session -> group
  std::unordered_map<std::string, std::map<int, std::string>> by_person_;
};

} // namespace gc
