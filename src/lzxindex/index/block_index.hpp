#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "lzxbase/env_config.hpp"
#include "lzxbase/result.hpp"
#include "lzxindex/format/header_parser.hpp"
#include "lzxindex/format/lzop_format.hpp"

namespace lzx::index {

struct block_index {
  std::vector<uint64_t> offsets{};
  // present when the index was built in this process rather than loaded
  std::optional<lzop_header> header{};

  size_t size() const { return offsets.size(); }
  bool empty() const { return offsets.empty(); }
};

struct block_index_options {
  // empty selects default_block_index_path(source)
  std::string index_path{};
  header_options header{};
  bool allow_build = true;
  bool force_rebuild = false;
};

// LZX_VERSION_GATE and LZX_FORCE_REBUILD
block_index_options load_block_index_options(const util::env_config& env);

std::string default_block_index_path(const std::string& source_path);

enum class block_index_status {
  ok,
  missing,
  stale,
  incompatible,
};

const char* block_index_status_name(block_index_status value);

// parses the header, scans every block and writes the index only when the scan reaches the
// end-of-stream marker. on any failure no index file is left at the target path.
result<block_index> create_block_index(
    const std::string& source_path, const block_index_options& options, redlog::logger log
);

result<block_index> load_block_index(const std::string& index_path, redlog::logger log);

block_index_status evaluate_block_index(
    const std::filesystem::path& source_path, const std::filesystem::path& index_path, const block_index& index,
    const header_options& header, std::string& error
);

// loads an existing index when it is current, otherwise rebuilds it (if options allow)
result<block_index> ensure_block_index(
    const std::string& source_path, const block_index_options& options, redlog::logger log
);

} // namespace lzx::index
