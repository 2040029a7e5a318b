#include "index_writer.hpp"

#include <string>

#include "lzxbase/byte_io.hpp"

namespace lzx::index {

status write_block_index(std::ostream& out, const std::vector<uint64_t>& offsets) {
  for (size_t i = 0; i < offsets.size(); ++i) {
    if (!io::write_stream_be_u64(out, offsets[i])) {
      return make_status(error_code::io_error, "failed to write index entry " + std::to_string(i));
    }
  }
  out.flush();
  if (!out.good()) {
    return make_status(error_code::io_error, "failed to flush index");
  }
  return ok_status();
}

} // namespace lzx::index
