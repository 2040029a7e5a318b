#include "byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <limits>

namespace lzx::io {

file_source::file_source(std::string path) : path_(std::move(path)) {}

status file_source::open() {
  close();

  std::error_code ec;
  auto file_size = std::filesystem::file_size(path_, ec);
  if (ec) {
    return make_status(error_code::io_error, "failed to stat " + path_ + ": " + ec.message());
  }

  stream_.open(path_, std::ios::binary | std::ios::in);
  if (!stream_.is_open()) {
    return make_status(error_code::io_error, "failed to open " + path_);
  }
  size_ = static_cast<uint64_t>(file_size);
  return ok_status();
}

void file_source::close() {
  if (stream_.is_open()) {
    stream_.close();
  }
  stream_.clear();
  size_ = 0;
}

result<size_t> file_source::read(void* data, size_t size) {
  if (!stream_.is_open()) {
    return error_result<size_t>(error_code::io_error, "file not open");
  }
  if (size == 0) {
    return ok_result<size_t>(0);
  }

  stream_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
  auto count = stream_.gcount();
  if (stream_.bad()) {
    return error_result<size_t>(error_code::io_error, "read failed on " + path_);
  }
  // a short read sets eof/fail; clear them so the cursor stays usable for seeks
  if (stream_.fail()) {
    stream_.clear();
  }
  return ok_result(static_cast<size_t>(count));
}

status file_source::seek(uint64_t offset) {
  if (!stream_.is_open()) {
    return make_status(error_code::io_error, "file not open");
  }
  if (offset > static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max())) {
    return make_status(error_code::io_error, "seek offset out of range");
  }

  stream_.clear();
  stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (stream_.fail()) {
    stream_.clear();
    return make_status(error_code::io_error, "seek failed on " + path_);
  }
  return ok_status();
}

result<uint64_t> file_source::tell() const {
  if (!stream_.is_open()) {
    return error_result<uint64_t>(error_code::io_error, "file not open");
  }
  auto position = stream_.tellg();
  if (position < 0) {
    return error_result<uint64_t>(error_code::io_error, "tell failed on " + path_);
  }
  return ok_result(static_cast<uint64_t>(position));
}

result<uint64_t> file_source::size() const {
  if (!stream_.is_open()) {
    return error_result<uint64_t>(error_code::io_error, "file not open");
  }
  return ok_result(size_);
}

buffer_source::buffer_source(std::span<const uint8_t> buffer) : buffer_(buffer) {}

result<size_t> buffer_source::read(void* data, size_t size) {
  if (cursor_ >= buffer_.size() || size == 0) {
    return ok_result<size_t>(0);
  }
  size_t available = buffer_.size() - static_cast<size_t>(cursor_);
  size_t count = std::min(available, size);
  std::memcpy(data, buffer_.data() + cursor_, count);
  cursor_ += count;
  return ok_result(count);
}

status buffer_source::seek(uint64_t offset) {
  // seeking past the end is allowed, like a file; the next read returns 0 bytes
  cursor_ = offset;
  return ok_status();
}

result<uint64_t> buffer_source::tell() const { return ok_result(cursor_); }

result<uint64_t> buffer_source::size() const { return ok_result(static_cast<uint64_t>(buffer_.size())); }

status read_exact(byte_source& source, void* data, size_t size) {
  auto* out = static_cast<uint8_t*>(data);
  size_t total = 0;
  while (total < size) {
    auto count = source.read(out + total, size - total);
    if (!count.ok()) {
      return count.status_info;
    }
    if (count.value == 0) {
      return make_status(error_code::io_error, "unexpected end of stream");
    }
    total += count.value;
  }
  return ok_status();
}

} // namespace lzx::io
