#include "index.hpp"

#include <iostream>

#include <redlog.hpp>

#include "lzxindex/index/block_index.hpp"

namespace lzxtool::commands {

int index(
    args::Positional<std::string>& file_flag, args::ValueFlag<std::string>& output_flag,
    args::Flag& library_gating_flag, args::Flag& force_flag, const lzx::util::env_config& env
) {
  auto log = redlog::get_logger("lzxtool.index");

  if (!file_flag) {
    log.err("input file required");
    std::cerr << "error: lzop file path is required" << std::endl;
    return 1;
  }
  std::string source_path = args::get(file_flag);

  auto options = lzx::index::load_block_index_options(env);
  if (output_flag) {
    options.index_path = args::get(output_flag);
  }
  if (library_gating_flag) {
    options.header.gate = lzx::index::version_gate::library;
  }
  if (force_flag) {
    options.force_rebuild = true;
  }

  auto built = lzx::index::ensure_block_index(source_path, options, log);
  if (!built.ok()) {
    log.err(
        "indexing failed", redlog::field("path", source_path),
        redlog::field("kind", lzx::error_code_name(built.status_info.code)),
        redlog::field("error", built.status_info.message)
    );
    return 1;
  }

  std::string index_path =
      options.index_path.empty() ? lzx::index::default_block_index_path(source_path) : options.index_path;
  log.inf("block index ready", redlog::field("index", index_path), redlog::field("blocks", built.value.size()));
  return 0;
}

} // namespace lzxtool::commands
