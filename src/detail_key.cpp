// detail_key.cpp
#include "detail_key.h"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace gc {

namespace {

// Ids are free-form, so the separators are escaped inside them.
std::string esc(const std::string& id) {
  std::string out;
  out.reserve(id.size());
  for (char c : id) {
    if (c == '\\' || c == '|' || c == ',') out += '\\';
    out += c;
  }
  return out;
}

// "=" + id when assigned, empty when not.
std::string opt_group(const std::optional<std::string>& g) {
  return g ? "=" + esc(*g) : std::string();
}

std::string join(std::vector<std::string> parts, char sep) {
  std::sort(parts.begin(), parts.end());
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += esc(parts[i]);
  }
  return out;
}

std::string pair_part(const PersonPair& p) {
  return p.first < p.second ? esc(p.first) + "|" + esc(p.second) : esc(p.second) + "|" + esc(p.first);
}

struct KeyVisitor {
  std::string operator()(const RepeatEncounterDetail& d) const {
    return "RepeatEncounter|" + pair_part(d.pair);
  }
  std::string operator()(const AttributeBalanceDetail& d) const {
    std::ostringstream os;
    os << "AttributeBalance|" << d.session << "|" << esc(d.group_id) << "|" << esc(d.attribute_value);
    return os.str();
  }
  std::string operator()(const ImmovableDetail& d) const {
    std::ostringstream os;
    os << "Immovable|" << d.session << "|" << esc(d.person_id) << "|" << esc(d.required_group)
       << "|" << opt_group(d.assigned_group);
    return os.str();
  }
  std::string operator()(const TogetherSplitDetail& d) const {
    std::vector<std::string> ids;
    ids.reserve(d.people.size());
    for (const auto& p : d.people) ids.push_back(p.person_id);
    return "TogetherSplit|" + std::to_string(d.session) + "|" + join(std::move(ids), ',');
  }
  std::string operator()(const NotTogetherDetail& d) const {
    return "NotTogether|" + std::to_string(d.session) + "|" + esc(d.group_id) + "|" + join(d.people, ',');
  }
  std::string operator()(const PairMeetingSummaryDetail& d) const {
    return "PairMeetingCountSummary|" + pair_part(d.people) + "|" + to_string(d.mode) + "|" +
           std::to_string(d.target);
  }
  std::string operator()(const PairMeetingTogetherDetail& d) const {
    return "PairMeetingTogether|" + std::to_string(d.session) + "|" + pair_part(d.people);
  }
  std::string operator()(const PairMeetingApartDetail& d) const {
    return "PairMeetingApart|" + std::to_string(d.session) + "|" + pair_part(d.people);
  }
};

} // namespace

std::string detail_key(const ViolationDetail& d) {
  return std::visit(KeyVisitor{}, d);
}

std::vector<ViolationDetail> dedupe_details(std::vector<ViolationDetail> details) {
  std::unordered_set<std::string> seen;
  seen.reserve(details.size() * 2);
  std::vector<ViolationDetail> out;
  out.reserve(details.size());
  for (auto& d : details) {
    if (seen.insert(detail_key(d)).second) out.push_back(std::move(d));
  }
  return out;
}

} // namespace gc
