#include "read_index.hpp"

#include <iostream>

#include <redlog.hpp>

#include "lzxbase/byte_source.hpp"
#include "lzxindex/index/block_index.hpp"
#include "lzxindex/scan/block_scanner.hpp"

namespace lzxtool::commands {

int read_index(
    args::Positional<std::string>& index_flag, args::ValueFlag<std::string>& source_flag,
    const lzx::util::env_config& env
) {
  auto log = redlog::get_logger("lzxtool.read_index");

  if (!index_flag) {
    log.err("index file required");
    std::cerr << "error: index file path is required" << std::endl;
    return 1;
  }
  std::string index_path = args::get(index_flag);

  auto loaded = lzx::index::load_block_index(index_path, log);
  if (!loaded.ok()) {
    log.err("failed to load index", redlog::field("error", loaded.status_info.message));
    return 1;
  }
  const auto& index = loaded.value;

  if (!source_flag) {
    for (uint64_t offset : index.offsets) {
      std::cout << offset << "\n";
    }
    return 0;
  }

  std::string source_path = args::get(source_flag);
  auto options = lzx::index::load_block_index_options(env);

  std::string reason;
  auto state = lzx::index::evaluate_block_index(source_path, index_path, index, options.header, reason);
  std::cout << "index:  " << index_path << " (" << index.size() << " blocks)\n";
  std::cout << "source: " << source_path << "\n";
  std::cout << "status: " << lzx::index::block_index_status_name(state);
  if (!reason.empty()) {
    std::cout << " (" << reason << ")";
  }
  std::cout << "\n";
  if (state == lzx::index::block_index_status::missing || state == lzx::index::block_index_status::incompatible) {
    return 1;
  }

  lzx::io::file_source source(source_path);
  if (auto st = source.open(); !st.ok()) {
    log.err("failed to open source", redlog::field("path", source_path), redlog::field("error", st.message));
    return 1;
  }

  for (size_t i = 0; i < index.offsets.size(); ++i) {
    auto sizes = lzx::index::read_block_sizes(source, index.offsets[i]);
    if (!sizes.ok()) {
      log.err("failed to read block", redlog::field("block", i), redlog::field("error", sizes.status_info.message));
      return 1;
    }
    std::cout << "  [" << i << "] offset " << index.offsets[i] << " dst " << sizes.value.dst_len << " src "
              << sizes.value.src_len << (sizes.value.stored() ? " stored" : "") << "\n";
  }
  return 0;
}

} // namespace lzxtool::commands
