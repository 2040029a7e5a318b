#include "checksum_reader.hpp"

#include <zlib.h>

namespace lzx::index {

checksum_reader::checksum_reader(io::byte_source& inner) : inner_(inner) { reset(); }

result<size_t> checksum_reader::read(void* data, size_t size) {
  auto count = inner_.read(data, size);
  if (!count.ok() || count.value == 0) {
    return count;
  }

  const auto* bytes = static_cast<const Bytef*>(data);
  auto length = static_cast<uInt>(count.value);
  crc32_ = static_cast<uint32_t>(::crc32(crc32_, bytes, length));
  adler32_ = static_cast<uint32_t>(::adler32(adler32_, bytes, length));
  consumed_ += count.value;
  return count;
}

status checksum_reader::seek(uint64_t) {
  return make_status(error_code::internal_error, "checksum reader does not support seeking");
}

void checksum_reader::reset() {
  crc32_ = static_cast<uint32_t>(::crc32(0L, Z_NULL, 0));
  adler32_ = static_cast<uint32_t>(::adler32(0L, Z_NULL, 0));
  consumed_ = 0;
}

} // namespace lzx::index
