#pragma once

#include <optional>
#include <string_view>

#include "deadsimple/http-method.hpp"

namespace deadsimple::http {

// Attempt to parse a HTTP method token. Matching is case-sensitive (RFC 9110 §9.1).
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace deadsimple::http
