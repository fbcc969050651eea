#include "spillway/core/platform_utils.hpp"

#include <algorithm>
#include <cctype>

namespace spillway::core {

std::optional<bool> parse_env_flag(const std::optional<std::string>& value) noexcept {
  if (!value || value->empty()) return std::nullopt;
  std::string v = *value;
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
  if (v == "0" || v == "false" || v == "off" || v == "no") return false;
  return std::nullopt;
}

} // namespace spillway::core
