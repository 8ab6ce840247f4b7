#include "deadsimple/query-args.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace deadsimple {

QueryArgs ParseQueryArgs(std::string_view query) {
  QueryArgs args;
  while (true) {
    const std::size_t ampPos = query.find('&');
    const std::string_view token = query.substr(0, ampPos);

    const std::size_t eqPos = token.find('=');
    if (eqPos != std::string_view::npos) {
      std::string_view value = token.substr(eqPos + 1);
      value = value.substr(0, value.find('='));
      args.insert_or_assign(std::string(token.substr(0, eqPos)), std::string(value));
    }

    if (ampPos == std::string_view::npos) {
      break;
    }
    query.remove_prefix(ampPos + 1);
  }
  return args;
}

}  // namespace deadsimple
