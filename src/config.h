// config.h
#pragma once
#include <nlohmann/json.hpp>

namespace gc {

struct Cfg {
  bool verbose = true;
  int threads = 1;
  int cache_capacity = 64;
  int max_details = 0;     // 0 => print all details in the console summary
  bool validate = true;
};

// Reads the upper-case config keys, falling back to defaults for absent ones.
// A non-object config or a wrongly typed value throws std::runtime_error.
Cfg parse_config(const nlohmann::json& j);

} // namespace gc
