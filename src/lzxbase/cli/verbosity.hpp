#pragma once

#include <redlog.hpp>

#include "lzxbase/env_config.hpp"

namespace lzx::cli {

// -v count to log level: info, verbose, trace, debug, pedantic
inline redlog::level level_from_verbosity(int count) {
  switch (count) {
  case 0:
    return redlog::level::info;
  case 1:
    return redlog::level::verbose;
  case 2:
    return redlog::level::trace;
  case 3:
    return redlog::level::debug;
  default:
    return count < 0 ? redlog::level::info : redlog::level::pedantic;
  }
}

// flag count wins; LZX_VERBOSE applies only when no -v was given
inline int resolve_verbosity(int flag_count, const util::env_config& env) {
  if (flag_count > 0) {
    return flag_count;
  }
  return env.get<int>("VERBOSE", 0);
}

inline void apply_verbosity(int flag_count, const util::env_config& env) {
  redlog::set_level(level_from_verbosity(resolve_verbosity(flag_count, env)));
}

} // namespace lzx::cli
