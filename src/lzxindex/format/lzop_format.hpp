#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace lzx::index {

constexpr std::array<uint8_t, 9> k_lzop_magic = {0x89, 'L', 'Z', 'O', 0x00, 0x0d, 0x0a, 0x1a, 0x0a};

// version this tool identifies as; also the gate used by version_gate::library
constexpr uint16_t k_lzop_library_version = 0x1030;
// oldest format and library versions accepted
constexpr uint16_t k_lzop_min_version = 0x0900;
// first revision carrying the extended header layout
constexpr uint16_t k_lzop_extended_header_version = 0x0940;
// first revision with meaningful mod-time fields
constexpr uint16_t k_lzop_mtime_version = 0x0120;

constexpr size_t k_lzop_max_name_length = 255;
constexpr size_t k_lzop_checksum_size = 4;
// dstLen + srcLen
constexpr uint64_t k_lzop_block_sizes_size = 8;

enum lzop_flags : uint32_t {
  lzop_flag_adler32_d = 1u << 0,
  lzop_flag_adler32_c = 1u << 1,
  lzop_flag_stdin = 1u << 2,
  lzop_flag_stdout = 1u << 3,
  lzop_flag_name_default = 1u << 4,
  lzop_flag_dosish = 1u << 5,
  lzop_flag_extra_field = 1u << 6,
  lzop_flag_gmt_diff = 1u << 7,
  lzop_flag_crc32_d = 1u << 8,
  lzop_flag_crc32_c = 1u << 9,
  lzop_flag_multipart = 1u << 10,
  lzop_flag_filter = 1u << 11,
  lzop_flag_header_crc32 = 1u << 12,
  lzop_flag_path = 1u << 13,
};

constexpr bool has_flag(uint32_t flags, lzop_flags flag) { return (flags & flag) != 0; }

// selects which version number drives the optional-field rules
enum class version_gate {
  // the format_version declared by the stream
  declared,
  // k_lzop_library_version regardless of what the stream declares
  library,
};

enum class header_field {
  version_needed,
  level,
  mtime_high,
  mtime,
};

struct header_field_rule {
  header_field field;
  uint16_t min_version;
};

// presence of version-dependent header fields, in stream order
constexpr std::array<header_field_rule, 4> k_header_field_rules = {{
    {header_field::version_needed, k_lzop_extended_header_version},
    {header_field::level, k_lzop_extended_header_version},
    {header_field::mtime_high, k_lzop_extended_header_version},
    {header_field::mtime, k_lzop_mtime_version},
}};

struct header_layout {
  bool has_version_needed = false;
  bool has_level = false;
  bool has_mtime_high = false;
  bool has_mtime = false;
};

constexpr header_layout resolve_header_layout(uint16_t gate_version) {
  header_layout layout{};
  for (const auto& rule : k_header_field_rules) {
    bool present = gate_version >= rule.min_version;
    switch (rule.field) {
    case header_field::version_needed:
      layout.has_version_needed = present;
      break;
    case header_field::level:
      layout.has_level = present;
      break;
    case header_field::mtime_high:
      layout.has_mtime_high = present;
      break;
    case header_field::mtime:
      layout.has_mtime = present;
      break;
    }
  }
  return layout;
}

struct checksum_counts {
  uint32_t decompressed = 0;
  uint32_t compressed = 0;
};

constexpr checksum_counts checksum_counts_from_flags(uint32_t flags) {
  checksum_counts counts{};
  counts.decompressed = (has_flag(flags, lzop_flag_adler32_d) ? 1u : 0u) + (has_flag(flags, lzop_flag_crc32_d) ? 1u : 0u);
  counts.compressed = (has_flag(flags, lzop_flag_adler32_c) ? 1u : 0u) + (has_flag(flags, lzop_flag_crc32_c) ? 1u : 0u);
  return counts;
}

struct lzop_header {
  uint16_t format_version = 0;
  uint16_t library_version = 0;
  uint8_t method = 0;
  uint8_t level = 0;
  uint32_t flags = 0;
  uint32_t filter = 0;
  uint32_t mode = 0;
  uint32_t mtime_low = 0;
  uint32_t mtime_high = 0;
  // seconds since the epoch; zero when the format predates mod-time semantics
  int64_t mod_time = 0;
  std::string name;
  uint32_t header_checksum = 0;
  checksum_counts checksums{};
  // stream offset of the first block
  uint64_t header_size = 0;
};

} // namespace lzx::index
