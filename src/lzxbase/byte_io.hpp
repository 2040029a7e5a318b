#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "lzxbase/byte_source.hpp"

namespace lzx::io {

// all multi-byte integers in lzop containers and index files are big-endian

inline uint16_t load_be_u16(const uint8_t* data) {
  return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

inline uint32_t load_be_u32(const uint8_t* data) {
  return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
         (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

inline uint64_t load_be_u64(const uint8_t* data) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value = (value << 8) | data[i];
  }
  return value;
}

inline void store_be_u64(uint64_t value, uint8_t* out) {
  for (size_t i = 0; i < 8; ++i) {
    out[i] = static_cast<uint8_t>((value >> ((7 - i) * 8)) & 0xFFu);
  }
}

inline status read_be_u8(byte_source& source, uint8_t& value) {
  return read_exact(source, &value, sizeof(value));
}

inline status read_be_u16(byte_source& source, uint16_t& value) {
  std::array<uint8_t, 2> buf{};
  auto st = read_exact(source, buf.data(), buf.size());
  if (st.ok()) {
    value = load_be_u16(buf.data());
  }
  return st;
}

inline status read_be_u32(byte_source& source, uint32_t& value) {
  std::array<uint8_t, 4> buf{};
  auto st = read_exact(source, buf.data(), buf.size());
  if (st.ok()) {
    value = load_be_u32(buf.data());
  }
  return st;
}

inline bool write_stream_bytes(std::ostream& out, const void* data, size_t size) {
  if (size == 0) {
    return true;
  }
  out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  return out.good();
}

inline bool write_stream_be_u64(std::ostream& out, uint64_t value) {
  std::array<uint8_t, 8> buf{};
  store_be_u64(value, buf.data());
  return write_stream_bytes(out, buf.data(), buf.size());
}

} // namespace lzx::io
