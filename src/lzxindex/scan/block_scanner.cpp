#include "block_scanner.hpp"

#include "lzxbase/byte_io.hpp"

namespace lzx::index {

const char* scan_condition_name(scan_condition condition) {
  switch (condition) {
  case scan_condition::none:
    return "none";
  case scan_condition::end_of_stream:
    return "end_of_stream";
  case scan_condition::corruption:
    return "corruption";
  case scan_condition::io_error:
    return "io_error";
  }
  return "unknown";
}

block_scanner::block_scanner(io::byte_source& source, checksum_counts checksums)
    : block_scanner(source, checksums, redlog::get_logger("lzx.scan")) {}

block_scanner::block_scanner(io::byte_source& source, checksum_counts checksums, redlog::logger log)
    : source_(source), log_(log) {
  state_.decompressed_checksum_count = checksums.decompressed;
  state_.compressed_checksum_count = checksums.compressed;
}

scan_condition block_scanner::finish(scan_condition condition, std::string message) {
  state_.condition = condition;
  state_.message = std::move(message);
  return condition;
}

scan_condition block_scanner::step() {
  if (state_.terminal()) {
    return state_.condition;
  }

  auto position = source_.tell();
  if (!position.ok()) {
    log_.err("failed to query stream position", redlog::field("error", position.status_info.message));
    return finish(scan_condition::io_error, position.status_info.message);
  }
  uint64_t block_start = position.value;

  uint32_t dst_len = 0;
  if (auto st = io::read_be_u32(source_, dst_len); !st.ok()) {
    log_.err(
        "failed to read block size", redlog::field("offset", block_start), redlog::field("error", st.message)
    );
    return finish(scan_condition::io_error, st.message);
  }
  if (dst_len == 0) {
    log_.dbg(
        "end of block sequence", redlog::field("offset", block_start),
        redlog::field("blocks", state_.block_offsets.size())
    );
    return finish(scan_condition::end_of_stream, "end of stream");
  }

  uint32_t src_len = 0;
  if (auto st = io::read_be_u32(source_, src_len); !st.ok()) {
    log_.err(
        "failed to read compressed block size", redlog::field("offset", block_start),
        redlog::field("error", st.message)
    );
    return finish(scan_condition::io_error, st.message);
  }
  // a block can never expand
  if (src_len == 0 || src_len > dst_len) {
    log_.err(
        "data corruption", redlog::field("offset", block_start), redlog::field("dst_len", dst_len),
        redlog::field("src_len", src_len)
    );
    return finish(scan_condition::corruption, "data corruption");
  }

  bool stored = dst_len == src_len;
  uint64_t checksum_fields = state_.decompressed_checksum_count;
  if (stored) {
    checksum_fields += state_.compressed_checksum_count;
  }

  state_.block_offsets.push_back(block_start);
  state_.total_uncompressed += dst_len;
  state_.total_compressed += src_len;
  if (stored) {
    state_.stored_block_count += 1;
  }

  uint64_t next_block = block_start + k_lzop_block_sizes_size + k_lzop_checksum_size * checksum_fields + src_len;
  log_.ped(
      "block", redlog::field("offset", block_start), redlog::field("dst_len", dst_len),
      redlog::field("src_len", src_len), redlog::field("checksums", checksum_fields),
      redlog::field("next", next_block)
  );

  if (auto st = source_.seek(next_block); !st.ok()) {
    log_.err("failed to seek to next block", redlog::field("offset", next_block), redlog::field("error", st.message));
    return finish(scan_condition::io_error, st.message);
  }
  return scan_condition::none;
}

scan_condition block_scanner::run() {
  while (step() == scan_condition::none) {
  }

  log_.trc(
      "block scan finished", redlog::field("condition", scan_condition_name(state_.condition)),
      redlog::field("blocks", state_.block_offsets.size()), redlog::field("stored", state_.stored_block_count),
      redlog::field("uncompressed", state_.total_uncompressed), redlog::field("compressed", state_.total_compressed)
  );
  return state_.condition;
}

status block_scanner::outcome() const {
  switch (state_.condition) {
  case scan_condition::end_of_stream:
    return ok_status();
  case scan_condition::corruption:
    return make_status(error_code::corruption, state_.message);
  case scan_condition::io_error:
    return make_status(error_code::io_error, state_.message);
  case scan_condition::none:
    break;
  }
  return make_status(error_code::internal_error, "block scan not finished");
}

result<block_sizes> read_block_sizes(io::byte_source& source, uint64_t offset) {
  if (auto st = source.seek(offset); !st.ok()) {
    return error_result<block_sizes>(std::move(st));
  }

  block_sizes sizes{};
  if (auto st = io::read_be_u32(source, sizes.dst_len); !st.ok()) {
    return error_result<block_sizes>(std::move(st));
  }
  if (sizes.dst_len == 0) {
    return error_result<block_sizes>(error_code::format_error, "offset addresses the end-of-stream marker");
  }
  if (auto st = io::read_be_u32(source, sizes.src_len); !st.ok()) {
    return error_result<block_sizes>(std::move(st));
  }
  if (sizes.src_len == 0 || sizes.src_len > sizes.dst_len) {
    return error_result<block_sizes>(error_code::corruption, "data corruption");
  }
  return ok_result(sizes);
}

} // namespace lzx::index
