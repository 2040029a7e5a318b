#pragma once

#include <string>

#include <args.hxx>

#include "lzxbase/env_config.hpp"

namespace lzxtool::commands {

int read_index(
    args::Positional<std::string>& index_flag, args::ValueFlag<std::string>& source_flag,
    const lzx::util::env_config& env
);

} // namespace lzxtool::commands
