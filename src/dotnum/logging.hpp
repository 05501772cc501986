#ifndef DOTNUM_LOGGING_HPP
#define DOTNUM_LOGGING_HPP

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>

namespace dotnum {

// Library-wide logger. Created on first use; if the application already
// registered a logger called "dotnum" that one is reused.
inline std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("dotnum");
    if (existing)
      return existing;
    auto created = spdlog::stderr_color_mt("dotnum");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

inline void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

}  // namespace dotnum

#endif  // DOTNUM_LOGGING_HPP
