// config.cpp
#include "config.h"
#include <stdexcept>
#include <string>

namespace gc {

Cfg parse_config(const nlohmann::json& j) {
  if (!j.is_object()) throw std::runtime_error("config must be a JSON object");
  try {
    Cfg c{
      /*verbose*/        j.value("VERBOSE", true),
      /*threads*/        j.value("THREADS", 1),
      /*cache_capacity*/ j.value("CACHE_CAPACITY", 64),
      /*max_details*/    j.value("MAX_DETAILS_PER_CONSTRAINT", 0),
      /*validate*/       j.value("VALIDATE", true)
    };
    return c;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
}

} // namespace gc
