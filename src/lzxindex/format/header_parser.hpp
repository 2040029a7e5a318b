#pragma once

#include <redlog.hpp>

#include "lzxbase/byte_source.hpp"
#include "lzxbase/result.hpp"
#include "lzxindex/format/lzop_format.hpp"

namespace lzx::index {

struct header_options {
  version_gate gate = version_gate::declared;
};

// decodes the container header from a source positioned at offset 0, leaving it positioned
// at the first block. reads sequentially and never seeks.
result<lzop_header> parse_header(io::byte_source& source, const header_options& options, redlog::logger log);

result<lzop_header> parse_header(io::byte_source& source, const header_options& options = {});

} // namespace lzx::index
