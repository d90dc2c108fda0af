#include "ke/log_severity.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace {
char const* names[] = {
    "trace", "debug", "info", "notice", "warning", "error", "critical", "alert", "fatal",
};
} // anonymous namespace

namespace ke {

std::ostream& operator<<(std::ostream& os, severity x) {
  return os << names[int(x)];
}

severity parse_severity(std::string const& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return char(std::tolower(c)); });
  for (int i = int(severity::LOWEST); i <= int(severity::HIGHEST); ++i) {
    if (lower == names[i]) {
      return severity(i);
    }
  }
  throw std::invalid_argument("parse_severity() - unknown severity <" + name + ">");
}

} // namespace ke
