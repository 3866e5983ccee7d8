#include "validation.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <sstream>
#include <unordered_set>

namespace gc
{

    inline bool is_blank(const std::string &s)
    {
        return std::all_of(s.begin(), s.end(), [](unsigned char c)
                           { return std::isspace(c); });
    }

    [[noreturn]] static void fail(const std::string &msg)
    {
        throw std::runtime_error(msg);
    }

    void validate_problem(const Problem &problem)
    {
        // 1) Entities
        validate_people(problem.people);
        validate_groups(problem.groups);

        // 2) Horizon
        validate_session_count(problem.num_sessions);

        // 3) Constraint parameters (references are only warned about)
        validate_constraint_parameters(problem.constraints);
    }

    void validate_people(const std::vector<Person> &people)
    {
        std::unordered_set<std::string> seen_ids;
        seen_ids.reserve(people.size() * 2);

        for (std::size_t i = 0; i < people.size(); ++i)
        {
            const Person &p = people[i];
            if (p.id.empty() || is_blank(p.id))
                fail("Person " + std::to_string(i) + " missing required field: id");
            if (!seen_ids.insert(p.id).second)
                fail("Duplicate person id found: " + p.id);
            if (p.allowed_sessions)
            {
                for (int s : *p.allowed_sessions)
                    if (s < 0)
                        fail("Person " + p.id + " has a negative session index: " + std::to_string(s));
            }
        }
    }

    void validate_groups(const std::vector<Group> &groups)
    {
        std::unordered_set<std::string> seen_ids;
        seen_ids.reserve(groups.size() * 2);

        for (std::size_t i = 0; i < groups.size(); ++i)
        {
            const Group &g = groups[i];
            if (g.id.empty() || is_blank(g.id))
                fail("Group " + std::to_string(i) + " missing required field: id");
            if (!seen_ids.insert(g.id).second)
                fail("Duplicate group id found: " + g.id);
            if (g.capacity <= 0)
                fail("Group " + g.id + " has invalid size (<=0).");
        }
    }

    void validate_session_count(int num_sessions)
    {
        if (num_sessions < 0)
            fail("num_sessions must be >= 0, got " + std::to_string(num_sessions) + ".");
    }

    void validate_constraint_parameters(const std::vector<Constraint> &constraints)
    {
        for (std::size_t i = 0; i < constraints.size(); ++i)
        {
            const Constraint &c = constraints[i];
            const std::string where = "Constraint #" + std::to_string(i) + " (" + constraint_type_name(c) + ")";

            if (auto p = std::get_if<RepeatEncounter>(&c))
            {
                if (p->max_allowed_encounters < 0)
                    fail(where + " has negative max_allowed_encounters.");
                if (p->penalty_weight < 0)
                    fail(where + " has negative penalty_weight.");
            }
            else if (auto p = std::get_if<AttributeBalance>(&c))
            {
                if (p->attribute_key.empty())
                    fail(where + " has an empty attribute_key.");
                for (const auto &kv : p->desired_values)
                    if (kv.second < 0)
                        fail(where + " wants a negative count for value \"" + kv.first + "\".");
                if (p->penalty_weight < 0)
                    fail(where + " has negative penalty_weight.");
            }
            else if (auto p = std::get_if<PairMeetingCount>(&c))
            {
                if (p->target_meetings < 0)
                    fail(where + " has negative target_meetings.");
                if (p->people.first == p->people.second)
                    fail(where + " pairs " + p->people.first + " with itself.");
                if (p->penalty_weight < 0)
                    fail(where + " has negative penalty_weight.");
            }
            else if (auto p = std::get_if<ShouldStayTogether>(&c))
            {
                if (p->penalty_weight < 0)
                    fail(where + " has negative penalty_weight.");
            }
            else if (auto p = std::get_if<ShouldNotBeTogether>(&c))
            {
                if (p->penalty_weight < 0)
                    fail(where + " has negative penalty_weight.");
            }
        }
    }

    // ---------- soft checks ----------

    namespace
    {
        struct References
        {
            std::vector<std::string> people;
            std::vector<std::string> groups;
            const SessionSet *sessions = nullptr;
        };

        References references_of(const Constraint &c)
        {
            References r;
            if (auto p = std::get_if<AttributeBalance>(&c))
            {
                r.groups = {p->group_id};
                r.sessions = &p->sessions;
            }
            else if (auto p = std::get_if<ImmovablePeople>(&c))
            {
                r.people = p->people;
                r.groups = {p->group_id};
                r.sessions = &p->sessions;
            }
            else if (auto p = std::get_if<ImmovablePerson>(&c))
            {
                r.people = {p->person_id};
                r.groups = {p->group_id};
                r.sessions = &p->sessions;
            }
            else if (auto p = std::get_if<MustStayTogether>(&c))
            {
                r.people = p->people;
                r.sessions = &p->sessions;
            }
            else if (auto p = std::get_if<ShouldStayTogether>(&c))
            {
                r.people = p->people;
                r.sessions = &p->sessions;
            }
            else if (auto p = std::get_if<ShouldNotBeTogether>(&c))
            {
                r.people = p->people;
                r.sessions = &p->sessions;
            }
            else if (auto p = std::get_if<PairMeetingCount>(&c))
            {
                r.people = {p->people.first, p->people.second};
                r.sessions = &p->sessions;
            }
            return r;
        }
    } // namespace

    std::vector<std::string> check_constraint_references(const Problem &problem)
    {
        std::unordered_set<std::string> people, groups;
        for (const auto &p : problem.people)
            people.insert(p.id);
        for (const auto &g : problem.groups)
            groups.insert(g.id);

        std::vector<std::string> warnings;
        for (std::size_t i = 0; i < problem.constraints.size(); ++i)
        {
            const Constraint &c = problem.constraints[i];
            const std::string where = "Constraint #" + std::to_string(i) + " (" + constraint_type_name(c) + ")";

            if (std::holds_alternative<UnknownConstraint>(c))
            {
                warnings.push_back(where + " has an unknown type; it will be reported as satisfied.");
                continue;
            }

            const References refs = references_of(c);
            for (const auto &pid : refs.people)
                if (!people.count(pid))
                    warnings.push_back(where + " references unknown person: " + pid);
            for (const auto &gid : refs.groups)
                if (!groups.count(gid))
                    warnings.push_back(where + " references unknown group: " + gid);
            if (refs.sessions && *refs.sessions)
            {
                for (int s : **refs.sessions)
                    if (s < 0 || s >= problem.num_sessions)
                        warnings.push_back(where + " references out-of-range session: " + std::to_string(s));
            }
        }
        return warnings;
    }

    std::vector<std::string> check_schedule(const Problem &problem, const Schedule &schedule)
    {
        std::unordered_set<std::string> people, groups;
        for (const auto &p : problem.people)
            people.insert(p.id);
        for (const auto &g : problem.groups)
            groups.insert(g.id);

        std::vector<std::string> warnings;
        std::set<std::string> reported_unknown;
        std::map<std::pair<std::string, int>, std::string> placed; // (person, session) -> group

        for (std::size_t i = 0; i < schedule.size(); ++i)
        {
            const Assignment &a = schedule[i];
            if (!people.count(a.person_id) && reported_unknown.insert("p:" + a.person_id).second)
                warnings.push_back("Schedule references unknown person: " + a.person_id);
            if (!groups.count(a.group_id) && reported_unknown.insert("g:" + a.group_id).second)
                warnings.push_back("Schedule references unknown group: " + a.group_id);
            if (a.session_id < 0 || a.session_id >= problem.num_sessions)
            {
                std::ostringstream oss;
                oss << "Assignment " << i << " (" << a.person_id << ") has out-of-range session "
                    << a.session_id << " (num_sessions=" << problem.num_sessions << ")";
                warnings.push_back(oss.str());
            }

            auto ins = placed.emplace(std::make_pair(a.person_id, a.session_id), a.group_id);
            if (!ins.second && ins.first->second != a.group_id)
            {
                warnings.push_back("Person " + a.person_id + " is in both " + ins.first->second + " and " +
                                   a.group_id + " in session " + std::to_string(a.session_id));
            }
        }
        return warnings;
    }

} // namespace gc
