#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kb_bridge {

// First max_chars UTF-8 code points of text; never splits a multi-byte sequence
[[nodiscard]] inline std::string truncate_utf8(std::string_view text, std::size_t max_chars)
{
  std::size_t chars = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (chars == max_chars) { return std::string(text.substr(0, pos)); }
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t width = 1;
    if (lead >= 0xF0U) {
      width = 4;
    } else if (lead >= 0xE0U) {
      width = 3;
    } else if (lead >= 0xC0U) {
      width = 2;
    }
    pos += width;
    ++chars;
  }
  return std::string(text);
}

[[nodiscard]] inline std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) { joined += separator; }
    joined += parts[i];
  }
  return joined;
}

} // namespace kb_bridge
