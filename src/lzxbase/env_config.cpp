#include "env_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

namespace lzx::util {

namespace {

void warn_parse_failure(const std::string& variable, const char* type_name, const std::exception& e) {
  redlog::get_logger("lzx.config")
      .wrn("failed to parse environment value, using default", redlog::field("variable", variable),
           redlog::field("type", type_name), redlog::field("error", e.what()));
}

} // namespace

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

std::string env_config::to_lower(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

std::string env_config::trim(const std::string& str) {
  size_t first = str.find_first_not_of(" \t");
  if (std::string::npos == first) {
    return std::string();
  }
  size_t last = str.find_last_not_of(" \t");
  return str.substr(first, (last - first + 1));
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  return (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on");
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    warn_parse_failure(build_env_name(name), "int", e);
    return default_value;
  }
}

} // namespace lzx::util
