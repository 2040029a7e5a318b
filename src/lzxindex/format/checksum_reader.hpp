#pragma once

#include <cstddef>
#include <cstdint>

#include "lzxbase/byte_source.hpp"

namespace lzx::index {

// tee over a byte source: every byte handed out is also fed to running crc32 and adler32
// accumulators. the accumulators belong to one header parse and are never shared.
class checksum_reader final : public io::byte_source {
public:
  explicit checksum_reader(io::byte_source& inner);
  ~checksum_reader() override = default;

  checksum_reader(const checksum_reader&) = delete;
  checksum_reader& operator=(const checksum_reader&) = delete;

  result<size_t> read(void* data, size_t size) override;
  // repositioning would desynchronize the accumulators from the stream
  status seek(uint64_t offset) override;
  result<uint64_t> tell() const override { return inner_.tell(); }
  result<uint64_t> size() const override { return inner_.size(); }

  void reset();
  uint32_t crc32() const { return crc32_; }
  uint32_t adler32() const { return adler32_; }
  uint64_t consumed() const { return consumed_; }

private:
  io::byte_source& inner_;
  uint32_t crc32_ = 0;
  uint32_t adler32_ = 1;
  uint64_t consumed_ = 0;
};

} // namespace lzx::index
