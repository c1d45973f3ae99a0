#include "vscore/common/name.hpp"

#include <algorithm>
#include <cctype>

namespace vscore {

auto IsCharacterLiteral(std::string_view spelling) -> bool {
  return spelling.size() == 3 && spelling.front() == '\'' &&
         spelling.back() == '\'';
}

auto CanonicalName(std::string_view spelling) -> std::string {
  std::string name(spelling);
  if (IsCharacterLiteral(spelling) ||
      (!spelling.empty() && spelling.front() == '\\')) {
    return name;
  }
  std::ranges::transform(name, name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return name;
}

}  // namespace vscore
