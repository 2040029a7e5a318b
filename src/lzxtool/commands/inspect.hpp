#pragma once

#include <string>

#include <args.hxx>

#include "lzxbase/env_config.hpp"

namespace lzxtool::commands {

int inspect(
    args::Positional<std::string>& file_flag, args::Flag& library_gating_flag, args::Flag& blocks_flag,
    const lzx::util::env_config& env
);

} // namespace lzxtool::commands
