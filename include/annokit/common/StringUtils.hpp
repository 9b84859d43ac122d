#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace annokit::common {

inline std::string toLowerCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline std::string trimCopy(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

// Every character that is not alphanumeric, '_' or '-' becomes '_'.
inline std::string sanitizeFilenameBase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return (std::isalnum(c) || c == '_' || c == '-') ? static_cast<char>(c) : '_';
  });
  return value;
}

}  // namespace annokit::common
