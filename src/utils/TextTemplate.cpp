/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/TextTemplate.hpp"

#include <algorithm>
#include <cctype>

namespace Realmforge {

std::string fillTemplate(const std::string &text,
                         const TemplateValues &values) {
  std::string result = text;
  for (const auto &[key, value] : values) {
    const std::string placeholder = "{" + key + "}";
    size_t pos = 0;
    while ((pos = result.find(placeholder, pos)) != std::string::npos) {
      result.replace(pos, placeholder.length(), value);
      pos += value.length();
    }
  }

  // Strip unresolved placeholders: '{' followed by one or more non-'}' then '}'
  std::string cleaned;
  cleaned.reserve(result.size());
  size_t i = 0;
  while (i < result.size()) {
    if (result[i] == '{') {
      size_t close = result.find('}', i + 1);
      if (close != std::string::npos && close > i + 1) {
        i = close + 1;
        continue;
      }
    }
    cleaned += result[i];
    ++i;
  }
  return cleaned;
}

std::string capitalize(const std::string &text) {
  if (text.empty()) {
    return text;
  }
  std::string result = text;
  result[0] =
      static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
  return result;
}

std::string toLower(const std::string &text) {
  std::string result = text;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

} // namespace Realmforge
