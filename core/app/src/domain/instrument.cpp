#include "papertrade/domain/instrument.hpp"

#include <algorithm>
#include <cctype>

namespace papertrade {
namespace domain {

Symbol normalizeSymbol(const std::string& raw) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(raw.begin(), raw.end(), is_space);
  auto end = std::find_if_not(raw.rbegin(), raw.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  Symbol symbol(begin, end);
  std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return symbol;
}

}  // namespace domain
}  // namespace papertrade
