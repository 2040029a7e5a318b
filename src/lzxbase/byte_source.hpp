#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <span>
#include <string>

#include "lzxbase/result.hpp"

namespace lzx::io {

// seekable, readable byte stream with a single mutable cursor.
// a source must not be shared between concurrent parses or scans.
class byte_source {
public:
  virtual ~byte_source() = default;

  // reads up to size bytes at the cursor; returns the number of bytes read (0 at end of stream)
  virtual result<size_t> read(void* data, size_t size) = 0;
  virtual status seek(uint64_t offset) = 0;
  virtual result<uint64_t> tell() const = 0;
  virtual result<uint64_t> size() const = 0;
};

class file_source final : public byte_source {
public:
  explicit file_source(std::string path);
  ~file_source() override = default;

  status open();
  void close();
  bool is_open() const { return stream_.is_open(); }
  const std::string& path() const { return path_; }

  result<size_t> read(void* data, size_t size) override;
  status seek(uint64_t offset) override;
  result<uint64_t> tell() const override;
  result<uint64_t> size() const override;

private:
  std::string path_;
  mutable std::ifstream stream_;
  uint64_t size_ = 0;
};

class buffer_source final : public byte_source {
public:
  explicit buffer_source(std::span<const uint8_t> buffer);
  ~buffer_source() override = default;

  result<size_t> read(void* data, size_t size) override;
  status seek(uint64_t offset) override;
  result<uint64_t> tell() const override;
  result<uint64_t> size() const override;

private:
  std::span<const uint8_t> buffer_;
  uint64_t cursor_ = 0;
};

// reads exactly size bytes or fails with io_error
status read_exact(byte_source& source, void* data, size_t size);

} // namespace lzx::io
