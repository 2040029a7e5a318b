#include "block_index.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <system_error>

#include "lzxbase/byte_io.hpp"
#include "lzxbase/byte_source.hpp"
#include "lzxindex/index/index_writer.hpp"
#include "lzxindex/scan/block_scanner.hpp"

namespace lzx::index {

namespace {

std::string resolve_index_path(const std::string& source_path, const block_index_options& options) {
  return options.index_path.empty() ? default_block_index_path(source_path) : options.index_path;
}

void remove_index_file(const std::string& index_path, redlog::logger& log) {
  std::error_code ec;
  if (std::filesystem::remove(index_path, ec)) {
    log.dbg("removed index file", redlog::field("path", index_path));
  } else if (ec) {
    log.wrn("failed to remove index file", redlog::field("path", index_path), redlog::field("error", ec.message()));
  }
}

status write_index_file(const std::string& index_path, const std::vector<uint64_t>& offsets, redlog::logger& log) {
  std::ofstream out_stream(index_path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out_stream.is_open()) {
    log.err("failed to open index output", redlog::field("path", index_path));
    return make_status(error_code::io_error, "failed to open " + index_path);
  }

  auto st = write_block_index(out_stream, offsets);
  out_stream.close();
  if (st.ok() && out_stream.fail()) {
    st = make_status(error_code::io_error, "failed to close " + index_path);
  }
  if (!st.ok()) {
    log.err("failed to write index", redlog::field("path", index_path), redlog::field("error", st.message));
    remove_index_file(index_path, log);
  }
  return st;
}

} // namespace

block_index_options load_block_index_options(const util::env_config& env) {
  block_index_options options;
  options.header.gate = env.get_enum<version_gate>(
      {{"declared", version_gate::declared}, {"library", version_gate::library}}, "VERSION_GATE",
      version_gate::declared
  );
  options.force_rebuild = env.get<bool>("FORCE_REBUILD", false);
  return options;
}

std::string default_block_index_path(const std::string& source_path) { return source_path + ".index"; }

const char* block_index_status_name(block_index_status value) {
  switch (value) {
  case block_index_status::ok:
    return "ok";
  case block_index_status::missing:
    return "missing";
  case block_index_status::stale:
    return "stale";
  case block_index_status::incompatible:
    return "incompatible";
  }
  return "unknown";
}

result<block_index> create_block_index(
    const std::string& source_path, const block_index_options& options, redlog::logger log
) {
  if (source_path.empty()) {
    log.err("source path required");
    return error_result<block_index>(error_code::invalid_argument, "source path required");
  }
  std::string index_path = resolve_index_path(source_path, options);

  io::file_source source(source_path);
  if (auto st = source.open(); !st.ok()) {
    log.err("failed to open source", redlog::field("path", source_path), redlog::field("error", st.message));
    return error_result<block_index>(std::move(st));
  }

  auto header = parse_header(source, options.header, log);
  if (!header.ok()) {
    log.err(
        "failed to parse header", redlog::field("path", source_path),
        redlog::field("error", header.status_info.message)
    );
    remove_index_file(index_path, log);
    return error_result<block_index>(header.status_info);
  }

  block_scanner scanner(source, header.value.checksums, log);
  scanner.run();
  if (auto st = scanner.outcome(); !st.ok()) {
    // offsets gathered before the failure are discarded
    log.err(
        "block scan failed", redlog::field("path", source_path),
        redlog::field("condition", scan_condition_name(scanner.state().condition)),
        redlog::field("blocks_before_failure", scanner.state().block_offsets.size()),
        redlog::field("error", st.message)
    );
    remove_index_file(index_path, log);
    return error_result<block_index>(std::move(st));
  }

  block_index index;
  index.offsets = scanner.state().block_offsets;
  index.header = std::move(header.value);

  if (auto st = write_index_file(index_path, index.offsets, log); !st.ok()) {
    return error_result<block_index>(std::move(st));
  }

  log.dbg(
      "wrote block index", redlog::field("source", source_path), redlog::field("index", index_path),
      redlog::field("blocks", index.offsets.size())
  );
  return ok_result(std::move(index));
}

result<block_index> load_block_index(const std::string& index_path, redlog::logger log) {
  std::ifstream in(index_path, std::ios::binary | std::ios::in);
  if (!in.is_open()) {
    log.err("failed to open block index", redlog::field("path", index_path));
    return error_result<block_index>(error_code::io_error, "failed to open " + index_path);
  }

  std::error_code ec;
  auto file_size = std::filesystem::file_size(index_path, ec);
  if (ec) {
    log.err("failed to stat block index", redlog::field("path", index_path), redlog::field("error", ec.message()));
    return error_result<block_index>(error_code::io_error, ec.message());
  }
  if (file_size % k_index_entry_size != 0) {
    log.err("block index size is not a multiple of entry size", redlog::field("size", file_size));
    return error_result<block_index>(error_code::format_error, "truncated block index");
  }

  block_index index;
  index.offsets.reserve(static_cast<size_t>(file_size / k_index_entry_size));
  std::array<uint8_t, k_index_entry_size> entry{};
  for (uint64_t i = 0; i < file_size / k_index_entry_size; ++i) {
    in.read(reinterpret_cast<char*>(entry.data()), static_cast<std::streamsize>(entry.size()));
    if (in.gcount() != static_cast<std::streamsize>(entry.size())) {
      log.err("failed to read block index entry", redlog::field("entry", i));
      return error_result<block_index>(error_code::io_error, "failed to read " + index_path);
    }
    uint64_t offset = io::load_be_u64(entry.data());
    if (!index.offsets.empty() && offset <= index.offsets.back()) {
      log.err(
          "block index offsets out of order", redlog::field("entry", i), redlog::field("offset", offset),
          redlog::field("previous", index.offsets.back())
      );
      return error_result<block_index>(error_code::format_error, "block index offsets out of order");
    }
    index.offsets.push_back(offset);
  }

  return ok_result(std::move(index));
}

block_index_status evaluate_block_index(
    const std::filesystem::path& source_path, const std::filesystem::path& index_path, const block_index& index,
    const header_options& header, std::string& error
) {
  error.clear();

  if (!std::filesystem::exists(source_path)) {
    error = "source file missing";
    return block_index_status::missing;
  }

  io::file_source source(source_path.string());
  if (auto st = source.open(); !st.ok()) {
    error = st.message;
    return block_index_status::incompatible;
  }

  auto parsed = parse_header(source, header, redlog::get_logger("lzx.index"));
  if (!parsed.ok()) {
    error = parsed.status_info.message;
    return block_index_status::incompatible;
  }

  // the stored offsets must be exactly the chain a fresh scan produces, ending at the end marker
  block_scanner scanner(source, parsed.value.checksums, redlog::get_logger("lzx.index"));
  if (scanner.run() != scan_condition::end_of_stream) {
    error = "source block chain unreadable: " + scanner.state().message;
    return block_index_status::incompatible;
  }

  const auto& scanned = scanner.state().block_offsets;
  if (scanned != index.offsets) {
    auto mismatch = std::mismatch(index.offsets.begin(), index.offsets.end(), scanned.begin(), scanned.end());
    error = "block index does not match source blocks at entry " +
            std::to_string(std::distance(index.offsets.begin(), mismatch.first)) + " (index " +
            std::to_string(index.size()) + ", source " + std::to_string(scanned.size()) + ")";
    return block_index_status::incompatible;
  }

  std::error_code source_ec;
  std::error_code index_ec;
  auto source_time = std::filesystem::last_write_time(source_path, source_ec);
  auto index_time = std::filesystem::last_write_time(index_path, index_ec);
  if (!source_ec && !index_ec && source_time > index_time) {
    error = "block index stale";
    return block_index_status::stale;
  }

  return block_index_status::ok;
}

result<block_index> ensure_block_index(
    const std::string& source_path, const block_index_options& options, redlog::logger log
) {
  if (source_path.empty()) {
    return error_result<block_index>(error_code::invalid_argument, "source path required");
  }
  if (!std::filesystem::exists(source_path)) {
    log.err("source file missing", redlog::field("path", source_path));
    return error_result<block_index>(error_code::io_error, "source file missing");
  }

  std::string index_path = resolve_index_path(source_path, options);
  bool index_available = !options.force_rebuild && std::filesystem::exists(index_path);

  if (index_available) {
    auto loaded = load_block_index(index_path, log);
    if (loaded.ok()) {
      std::string status_error;
      auto state = evaluate_block_index(source_path, index_path, loaded.value, options.header, status_error);
      if (state == block_index_status::ok) {
        log.dbg("block index up to date", redlog::field("path", index_path));
        return loaded;
      }
      log.vrb(
          "block index needs rebuild", redlog::field("path", index_path),
          redlog::field("status", block_index_status_name(state)), redlog::field("reason", status_error)
      );
      if (!options.allow_build) {
        return error_result<block_index>(error_code::format_error, status_error);
      }
    } else if (!options.allow_build) {
      return loaded;
    }
  } else if (!options.allow_build) {
    return error_result<block_index>(error_code::io_error, "block index missing");
  }

  return create_block_index(source_path, options, log);
}

} // namespace lzx::index
