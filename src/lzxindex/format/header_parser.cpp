#include "header_parser.hpp"

#include <algorithm>
#include <array>

#include "lzxbase/byte_io.hpp"
#include "lzxindex/format/checksum_reader.hpp"

namespace lzx::index {

namespace {

result<lzop_header> format_failure(redlog::logger& log, const char* message, uint64_t offset) {
  log.err(message, redlog::field("offset", offset));
  return error_result<lzop_header>(error_code::format_error, message);
}

result<lzop_header> read_failure(redlog::logger& log, const char* field, status info) {
  log.err("failed to read header field", redlog::field("field", field), redlog::field("error", info.message));
  return error_result<lzop_header>(info.code, std::string("failed to read ") + field + ": " + info.message);
}

} // namespace

result<lzop_header> parse_header(io::byte_source& source, const header_options& options) {
  return parse_header(source, options, redlog::get_logger("lzx.header"));
}

result<lzop_header> parse_header(io::byte_source& source, const header_options& options, redlog::logger log) {
  // a stream too short to hold the magic is not an lzop stream, so only real read errors are io errors
  std::array<uint8_t, k_lzop_magic.size()> magic{};
  size_t magic_read = 0;
  while (magic_read < magic.size()) {
    auto count = source.read(magic.data() + magic_read, magic.size() - magic_read);
    if (!count.ok()) {
      return read_failure(log, "magic", std::move(count.status_info));
    }
    if (count.value == 0) {
      break;
    }
    magic_read += count.value;
  }
  if (magic_read != magic.size() || !std::equal(magic.begin(), magic.end(), k_lzop_magic.begin())) {
    return format_failure(log, "invalid header", 0);
  }

  // everything after the magic is covered by the header checksum
  checksum_reader reader(source);
  auto offset = [&reader]() { return static_cast<uint64_t>(k_lzop_magic.size()) + reader.consumed(); };

  lzop_header header{};

  if (auto st = io::read_be_u16(reader, header.format_version); !st.ok()) {
    return read_failure(log, "version", std::move(st));
  }

  uint16_t gate_version = options.gate == version_gate::declared ? header.format_version : k_lzop_library_version;
  if (gate_version < k_lzop_min_version) {
    log.err("unsupported format version", redlog::field("version", header.format_version));
    return error_result<lzop_header>(error_code::format_error, "invalid header");
  }
  const header_layout layout = resolve_header_layout(gate_version);

  log.dbg(
      "header layout", redlog::field("version", header.format_version), redlog::field("gate_version", gate_version),
      redlog::field("version_needed", layout.has_version_needed), redlog::field("level", layout.has_level),
      redlog::field("mtime_high", layout.has_mtime_high)
  );

  if (auto st = io::read_be_u16(reader, header.library_version); !st.ok()) {
    return read_failure(log, "library version", std::move(st));
  }
  if (layout.has_version_needed) {
    if (auto st = io::read_be_u16(reader, header.library_version); !st.ok()) {
      return read_failure(log, "version needed to extract", std::move(st));
    }
    if (header.library_version > header.format_version) {
      log.err(
          "incompatible version", redlog::field("needed", header.library_version),
          redlog::field("version", header.format_version)
      );
      return error_result<lzop_header>(error_code::format_error, "incompatible version");
    }
    if (header.library_version < k_lzop_min_version) {
      return format_failure(log, "invalid header", offset());
    }
  }

  if (auto st = io::read_be_u8(reader, header.method); !st.ok()) {
    return read_failure(log, "method", std::move(st));
  }
  if (layout.has_level) {
    if (auto st = io::read_be_u8(reader, header.level); !st.ok()) {
      return read_failure(log, "level", std::move(st));
    }
  }

  if (auto st = io::read_be_u32(reader, header.flags); !st.ok()) {
    return read_failure(log, "flags", std::move(st));
  }
  if (has_flag(header.flags, lzop_flag_filter)) {
    if (auto st = io::read_be_u32(reader, header.filter); !st.ok()) {
      return read_failure(log, "filter", std::move(st));
    }
  }
  header.checksums = checksum_counts_from_flags(header.flags);

  if (auto st = io::read_be_u32(reader, header.mode); !st.ok()) {
    return read_failure(log, "mode", std::move(st));
  }

  if (auto st = io::read_be_u32(reader, header.mtime_low); !st.ok()) {
    return read_failure(log, "mtime", std::move(st));
  }
  if (layout.has_mtime_high) {
    if (auto st = io::read_be_u32(reader, header.mtime_high); !st.ok()) {
      return read_failure(log, "mtime high", std::move(st));
    }
  }
  header.mod_time = 0;
  if (layout.has_mtime) {
    header.mod_time = static_cast<int64_t>((static_cast<uint64_t>(header.mtime_high) << 32) | header.mtime_low);
  }

  uint8_t name_length = 0;
  if (auto st = io::read_be_u8(reader, name_length); !st.ok()) {
    return read_failure(log, "name length", std::move(st));
  }
  if (name_length > 0) {
    header.name.resize(name_length);
    if (auto st = io::read_exact(reader, header.name.data(), header.name.size()); !st.ok()) {
      return read_failure(log, "name", std::move(st));
    }
  }

  uint32_t expected =
      has_flag(header.flags, lzop_flag_header_crc32) ? reader.crc32() : reader.adler32();
  if (auto st = io::read_be_u32(reader, header.header_checksum); !st.ok()) {
    return read_failure(log, "header checksum", std::move(st));
  }
  header.header_size = offset();
  reader.reset();

  if (header.header_checksum != expected) {
    log.err(
        "header checksum mismatch", redlog::field("declared", header.header_checksum),
        redlog::field("computed", expected),
        redlog::field("algorithm", has_flag(header.flags, lzop_flag_header_crc32) ? "crc32" : "adler32")
    );
    return error_result<lzop_header>(error_code::format_error, "invalid header");
  }

  if (header.method == 0) {
    log.err("incompatible method", redlog::field("method", header.method));
    return error_result<lzop_header>(error_code::format_error, "incompatible method");
  }

  log.trc(
      "parsed header", redlog::field("version", header.format_version),
      redlog::field("library_version", header.library_version), redlog::field("method", header.method),
      redlog::field("flags", header.flags), redlog::field("name", header.name),
      redlog::field("header_size", header.header_size),
      redlog::field("decompressed_checksums", header.checksums.decompressed),
      redlog::field("compressed_checksums", header.checksums.compressed)
  );
  return ok_result(std::move(header));
}

} // namespace lzx::index
