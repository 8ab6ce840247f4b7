#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace deadsimple {

// Query arguments of a request. Values are kept as received (not URL decoded).
using QueryArgs = std::unordered_map<std::string, std::string>;

// Parse the query component of a request target (the part after the first '?', excluded).
//  - tokens are separated by '&', names from values by '='
//  - a token is kept only if it contains '=' ("a=" gives a -> "", "=x" gives "" -> x, "bad" is dropped)
//  - only the text up to a second '=' is kept as value ("a=b=c" gives a -> b)
//  - later duplicate keys overwrite earlier ones
[[nodiscard]] QueryArgs ParseQueryArgs(std::string_view query);

}  // namespace deadsimple
