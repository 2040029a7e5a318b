#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "lzxbase/result.hpp"

namespace lzx::index {

constexpr size_t k_index_entry_size = 8;

// writes each offset as an 8-byte big-endian integer; no header, footer or separators
status write_block_index(std::ostream& out, const std::vector<uint64_t>& offsets);

} // namespace lzx::index
