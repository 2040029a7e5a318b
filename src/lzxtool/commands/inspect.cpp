#include "inspect.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include <redlog.hpp>

#include "lzxbase/byte_source.hpp"
#include "lzxbase/time_utils.hpp"
#include "lzxindex/format/header_parser.hpp"
#include "lzxindex/index/block_index.hpp"
#include "lzxindex/scan/block_scanner.hpp"

namespace lzxtool::commands {

namespace {

std::string format_hex(uint32_t value, int width) {
  std::stringstream ss;
  ss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
  return ss.str();
}

std::string format_checksums(uint32_t flags, lzx::index::lzop_flags adler, lzx::index::lzop_flags crc) {
  std::string result;
  if (lzx::index::has_flag(flags, adler)) {
    result = "adler32";
  }
  if (lzx::index::has_flag(flags, crc)) {
    result += result.empty() ? "crc32" : "+crc32";
  }
  return result.empty() ? "none" : result;
}

} // namespace

int inspect(
    args::Positional<std::string>& file_flag, args::Flag& library_gating_flag, args::Flag& blocks_flag,
    const lzx::util::env_config& env
) {
  auto log = redlog::get_logger("lzxtool.inspect");

  if (!file_flag) {
    log.err("input file required");
    std::cerr << "error: lzop file path is required" << std::endl;
    return 1;
  }
  std::string source_path = args::get(file_flag);

  auto options = lzx::index::load_block_index_options(env);
  if (library_gating_flag) {
    options.header.gate = lzx::index::version_gate::library;
  }

  lzx::io::file_source source(source_path);
  if (auto st = source.open(); !st.ok()) {
    log.err("failed to open file", redlog::field("path", source_path), redlog::field("error", st.message));
    return 1;
  }

  auto parsed = lzx::index::parse_header(source, options.header);
  if (!parsed.ok()) {
    log.err("failed to parse header", redlog::field("error", parsed.status_info.message));
    return 1;
  }
  const auto& header = parsed.value;

  lzx::index::block_scanner scanner(source, header.checksums);
  scanner.run();
  const auto& state = scanner.state();

  std::cout << "LZOP Container\n";
  std::cout << "══════════════\n";
  std::cout << "├─ Header (" << header.header_size << " bytes)\n";
  std::cout << "│  ├─ Version:    " << format_hex(header.format_version, 4) << " (needs "
            << format_hex(header.library_version, 4) << ")\n";
  std::cout << "│  ├─ Method:     " << static_cast<int>(header.method) << " level " << static_cast<int>(header.level)
            << "\n";
  std::cout << "│  ├─ Flags:      " << format_hex(header.flags, 8) << "\n";
  std::cout << "│  ├─ Checksums:  data "
            << format_checksums(header.flags, lzx::index::lzop_flag_adler32_d, lzx::index::lzop_flag_crc32_d)
            << ", compressed "
            << format_checksums(header.flags, lzx::index::lzop_flag_adler32_c, lzx::index::lzop_flag_crc32_c)
            << "\n";
  std::cout << "│  ├─ Mode:       " << std::oct << header.mode << std::dec << "\n";
  std::cout << "│  ├─ Modified:   " << lzx::util::format_utc_seconds(header.mod_time) << "\n";
  std::cout << "│  └─ Name:       " << (header.name.empty() ? "-" : header.name) << "\n";

  std::cout << "└─ Blocks (" << state.block_offsets.size() << " total, " << state.stored_block_count << " stored)\n";
  std::cout << "   ├─ Uncompressed: " << state.total_uncompressed << " B\n";
  std::cout << "   ├─ Compressed:   " << state.total_compressed << " B\n";
  std::cout << "   └─ End:          " << lzx::index::scan_condition_name(state.condition);
  if (state.condition != lzx::index::scan_condition::end_of_stream) {
    std::cout << " (" << state.message << ")";
  }
  std::cout << "\n";

  if (blocks_flag) {
    for (size_t i = 0; i < state.block_offsets.size(); ++i) {
      std::cout << "  [" << i << "] offset " << state.block_offsets[i] << "\n";
    }
  }

  return scanner.outcome().ok() ? 0 : 1;
}

} // namespace lzxtool::commands
