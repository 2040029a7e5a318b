#pragma once

#include <string>
#include <utility>

namespace lzx {

// error codes shared by the parser, scanner and index layers
enum class error_code {
  ok,
  invalid_argument,
  format_error,
  corruption,
  io_error,
  end_of_stream,
  internal_error
};

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status info) { return result<T>{T{}, std::move(info)}; }

inline const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::format_error:
    return "format_error";
  case error_code::corruption:
    return "corruption";
  case error_code::io_error:
    return "io_error";
  case error_code::end_of_stream:
    return "end_of_stream";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

} // namespace lzx
