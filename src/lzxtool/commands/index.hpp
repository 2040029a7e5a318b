#pragma once

#include <string>

#include <args.hxx>

#include "lzxbase/env_config.hpp"

namespace lzxtool::commands {

/**
 * index command - build the block index for an lzop file
 *
 * @param file_flag path to the lzop file
 * @param output_flag index path (default: <file>.index)
 * @param library_gating_flag gate optional header fields on the tool version instead of the declared one
 * @param force_flag rebuild even when a current index exists
 * @return exit code (0 for success, 1 for failure)
 */
int index(
    args::Positional<std::string>& file_flag, args::ValueFlag<std::string>& output_flag,
    args::Flag& library_gating_flag, args::Flag& force_flag, const lzx::util::env_config& env
);

} // namespace lzxtool::commands
