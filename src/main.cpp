// main.cpp
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include "utils.h"
#include "types.h"
#include "cache.h"
#include "change_report.h"
#include "compliance.h"
#include "config.h"
#include "problem_io.h"
#include "validation.h"

using json = nlohmann::json;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string problem_path;       // required
  std::string solution_path;      // required (the "after" schedule when diffing)
  std::string before_path;        // optional: switches to diff mode
  std::string config_path;        // optional
  std::string out_path;           // optional: JSON output file
  int threads = 0;                // 0 => take from config
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  groupcheck --problem problem.json --solution solution.json [--before before.json]
             [--config config.json] [--out report.json] [--threads N] [--quiet]

Required:
  --problem PATH      Problem definition (people, groups, num_sessions, constraints)
  --solution PATH     Schedule to evaluate (Solution object or array of assignments)

Optional:
  --before PATH       Earlier schedule; writes a change report instead of a compliance report
  --config PATH       JSON config (VERBOSE, THREADS, CACHE_CAPACITY, MAX_DETAILS_PER_CONSTRAINT, VALIDATE)
  --out PATH          Write the JSON report here (default: stdout)
  --threads N         Evaluate constraints on N threads
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--problem")  f.problem_path = need("--problem");
    else if (a == "--solution") f.solution_path = need("--solution");
    else if (a == "--before")   f.before_path = need("--before");
    else if (a == "--config")   f.config_path = need("--config");
    else if (a == "--out")      f.out_path = need("--out");
    else if (a == "--threads") {
      const std::string v = need("--threads");
      try { f.threads = std::stoi(v); }
      catch (const std::exception&) { std::cerr << "Invalid --threads value: " << v << "\n"; std::exit(2); }
    }
    else if (a == "--quiet") f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.problem_path.empty() || f.solution_path.empty()) {
    std::cerr << "Missing required --problem/--solution.\n"; print_usage(); std::exit(2);
  }
  return f;
}

// ---------------- Console summaries ----------------
static void print_details(const std::vector<gc::ViolationDetail>& details, int max_details, const char* prefix) {
  const size_t shown = (max_details > 0) ? std::min(details.size(), static_cast<size_t>(max_details)) : details.size();
  for (size_t i = 0; i < shown; ++i) std::cout << "      " << prefix << gc::describe_detail(details[i]) << "\n";
  if (shown < details.size()) std::cout << "      ... " << (details.size() - shown) << " more\n";
}

static void print_compliance(const gc::ComplianceReport& report, int max_details) {
  std::cout << "\n# Constraint compliance\n";
  std::cout << std::right << std::setw(4) << "#" << "  "
            << std::left << std::setw(44) << "constraint"
            << std::right << std::setw(8) << "ok"
            << std::setw(12) << "violations" << "\n";
  for (const auto& r : report) {
    std::cout << std::right << std::setw(4) << r.constraint_index << "  "
              << std::left << std::setw(44) << r.title
              << std::right << std::setw(8) << (r.adheres ? "yes" : "no")
              << std::setw(12) << r.violations_count << "\n";
    if (!r.adheres) print_details(r.details, max_details, "");
  }
  std::cout << std::endl;
}

static void print_change(const gc::ChangeReport& cr, int max_details) {
  std::cout << "\n# Change report\n";
  std::cout << "final_score delta: " << std::showpos << std::fixed << std::setprecision(2)
            << cr.score_delta.final_score << "  weighted constraint delta: "
            << cr.aggregate_score_delta << std::noshowpos << "\n";
  const auto shown = gc::surfaced_deltas(cr);
  if (shown.empty()) {
    std::cout << "   no constraint changes\n" << std::endl;
    return;
  }
  for (const auto* d : shown) {
    std::cout << "   " << (d->is_hard ? "[hard] " : "[soft] ") << "#" << d->constraint_index << " " << d->type
              << "  " << d->before_count << " -> " << d->after_count
              << "  (" << std::showpos << d->weighted_delta << std::noshowpos << ")\n";
    print_details(d->added_details, max_details, "+ ");
    print_details(d->removed_details, max_details, "- ");
  }
  std::cout << std::endl;
}

static void warn_all(const std::vector<std::string>& warnings) {
  for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  json problem_json, solution_json, before_json, cfg_json = json::object();
  try {
    problem_json = load_json(flags.problem_path);
    solution_json = load_json(flags.solution_path);
    if (!flags.before_path.empty()) before_json = load_json(flags.before_path);
    if (!flags.config_path.empty()) cfg_json = load_json(flags.config_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  gc::Cfg cfg;
  try { cfg = gc::parse_config(cfg_json); }
  catch (const std::exception& e) {
    std::cerr << "Invalid config: " << e.what() << "\n"; return 1;
  }
  if (!flags.verbose) cfg.verbose = false;
  if (flags.threads > 0) cfg.threads = flags.threads;
  cfg.threads = std::max(1, std::min(cfg.threads, static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))));

  gc::Problem problem;
  gc::Solution after, before;
  try {
    problem = gc::parse_problem(problem_json);
    after = gc::parse_solution(solution_json);
    if (!flags.before_path.empty()) before = gc::parse_solution(before_json);
    if (cfg.validate) gc::validate_problem(problem);
  } catch (const std::exception& e) {
    std::cerr << "Invalid input: " << e.what() << "\n"; return 1;
  }

  if (cfg.verbose) {
    std::cout << "[compliance] people=" << problem.people.size()
              << " groups=" << problem.groups.size()
              << " sessions=" << problem.num_sessions
              << " constraints=" << problem.constraints.size()
              << " threads=" << cfg.threads << "\n";
    warn_all(gc::check_constraint_references(problem));
    warn_all(gc::check_schedule(problem, after.assignments));
    if (!flags.before_path.empty()) warn_all(gc::check_schedule(problem, before.assignments));
  }

  gc::BuildOptions opts;
  opts.threads = cfg.threads;
  opts.verbose = cfg.verbose;

  gc::ReportCache cache;
  cache.capacity = static_cast<size_t>(std::max(0, cfg.cache_capacity));

  json out;
  try {
    const long long t0 = NowMillis();
    const gc::ComplianceReport after_report = cache.get_or_build(problem, after.assignments, opts);
    if (flags.before_path.empty()) {
      if (cfg.verbose) {
        print_compliance(after_report, cfg.max_details);
        const gc::ScheduleIndex idx(after.assignments, problem.num_sessions);
        const gc::ContactStats contacts =
            gc::compute_unique_contacts(idx, static_cast<int>(problem.people.size()));
        std::cout << "[compliance] violated=" << gc::count_violated(after_report)
                  << " unique_contacts=" << contacts.unique_contacts
                  << " avg=" << std::fixed << std::setprecision(2) << contacts.avg_unique_contacts << "\n";
      }
      out = gc::report_to_json(after_report);
    } else {
      const gc::ComplianceReport before_report = cache.get_or_build(problem, before.assignments, opts);
      const gc::ChangeReport change =
          gc::build_change_report(before_report, after_report, before.score, after.score);
      if (cfg.verbose) print_change(change, cfg.max_details);
      out = gc::change_report_to_json(change);
    }
    if (cfg.verbose) {
      std::cout << "[compliance] evaluated in " << (NowMillis() - t0) << " ms"
                << " (cache hits=" << cache.hits << " misses=" << cache.misses << ")\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Evaluation failed: " << e.what() << "\n"; return 3;
  }

  if (flags.out_path.empty()) {
    std::cout << out.dump(2) << "\n";
    return 0;
  }
  try { save_json(flags.out_path, out); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }

  if (cfg.verbose) std::cout << "Result written to " << flags.out_path << "\n";
  return 0;
}
