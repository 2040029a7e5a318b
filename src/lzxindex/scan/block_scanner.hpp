#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "lzxbase/byte_source.hpp"
#include "lzxbase/result.hpp"
#include "lzxindex/format/lzop_format.hpp"

namespace lzx::index {

enum class scan_condition {
  none,
  end_of_stream,
  corruption,
  io_error,
};

const char* scan_condition_name(scan_condition condition);

struct scan_state {
  uint32_t decompressed_checksum_count = 0;
  uint32_t compressed_checksum_count = 0;
  // offsets of each block's dstLen field, in block order
  std::vector<uint64_t> block_offsets;
  scan_condition condition = scan_condition::none;
  std::string message;

  uint64_t stored_block_count = 0;
  uint64_t total_uncompressed = 0;
  uint64_t total_compressed = 0;

  bool terminal() const { return condition != scan_condition::none; }
};

// walks the block sequence after the header, seeking over payloads and checksums.
// owns the source cursor for the duration of the scan.
class block_scanner {
public:
  block_scanner(io::byte_source& source, checksum_counts checksums);
  block_scanner(io::byte_source& source, checksum_counts checksums, redlog::logger log);

  // one block; returns the condition after the step (none while more blocks follow).
  // once terminal, the state is frozen and the stream is no longer touched.
  scan_condition step();
  scan_condition run();

  const scan_state& state() const { return state_; }
  // end_of_stream maps to ok; any other terminal condition to its error code
  status outcome() const;

private:
  scan_condition finish(scan_condition condition, std::string message);

  io::byte_source& source_;
  scan_state state_{};
  redlog::logger log_;
};

struct block_sizes {
  uint32_t dst_len = 0;
  uint32_t src_len = 0;

  bool stored() const { return dst_len == src_len; }
};

// reads the size fields of the block starting at offset, as recorded in an index
result<block_sizes> read_block_sizes(io::byte_source& source, uint64_t offset);

} // namespace lzx::index
