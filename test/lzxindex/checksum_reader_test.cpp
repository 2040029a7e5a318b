#include <array>
#include <string_view>
#include <vector>

#include <doctest/doctest.h>

#include "lzxbase/byte_io.hpp"
#include "lzxbase/byte_source.hpp"
#include "lzxindex/format/checksum_reader.hpp"

namespace {

std::vector<uint8_t> bytes_of(std::string_view text) { return std::vector<uint8_t>(text.begin(), text.end()); }

} // namespace

TEST_CASE("checksum reader tracks crc32 and adler32 of consumed bytes") {
  auto data = bytes_of("123456789");
  lzx::io::buffer_source source(data);
  lzx::index::checksum_reader reader(source);

  std::array<uint8_t, 9> out{};
  REQUIRE(lzx::io::read_exact(reader, out.data(), 4).ok());
  REQUIRE(lzx::io::read_exact(reader, out.data() + 4, 5).ok());

  CHECK(reader.crc32() == 0xCBF43926u);
  CHECK(reader.adler32() == 0x091E01DEu);
  CHECK(reader.consumed() == 9);
}

TEST_CASE("checksum reader reset restarts both accumulators") {
  auto data = bytes_of("xx123456789");
  lzx::io::buffer_source source(data);
  lzx::index::checksum_reader reader(source);

  uint16_t prefix = 0;
  REQUIRE(lzx::io::read_be_u16(reader, prefix).ok());
  CHECK(prefix == 0x7878);
  reader.reset();
  CHECK(reader.crc32() == 0u);
  CHECK(reader.adler32() == 1u);
  CHECK(reader.consumed() == 0);

  std::array<uint8_t, 9> out{};
  REQUIRE(lzx::io::read_exact(reader, out.data(), out.size()).ok());
  CHECK(reader.crc32() == 0xCBF43926u);
}

TEST_CASE("checksum reader does not count bytes past the end of the stream") {
  auto data = bytes_of("12");
  lzx::io::buffer_source source(data);
  lzx::index::checksum_reader reader(source);

  uint32_t value = 0;
  auto st = lzx::io::read_be_u32(reader, value);
  CHECK(st.code == lzx::error_code::io_error);
  CHECK(reader.consumed() == 2);
}

TEST_CASE("checksum reader refuses to seek") {
  auto data = bytes_of("123");
  lzx::io::buffer_source source(data);
  lzx::index::checksum_reader reader(source);

  CHECK_FALSE(reader.seek(1).ok());
  auto position = reader.tell();
  REQUIRE(position.ok());
  CHECK(position.value == 0);
}
