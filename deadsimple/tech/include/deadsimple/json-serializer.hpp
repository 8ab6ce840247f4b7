#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <optional>
#include <string>
#include <string_view>

namespace deadsimple {

/// Serialize a C++ object to a compact JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize
/// (aggregates are reflected automatically, other types need a glz::meta specialization).
/// Example usage:
///   struct Message { std::string username; std::string message; };
///   auto jsonStr = deadsimple::SerializeToJson(msg);
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

/// Parse JSON text into a default constructed T. Returns std::nullopt if the text is not valid JSON
/// or does not fit T. Unknown keys are rejected, as glaze does by default.
template <typename T>
[[nodiscard]] std::optional<T> ParseJson(std::string_view json) {
  T obj{};
  if (auto ec = glz::read_json(obj, json); ec) {
    return std::nullopt;
  }
  return obj;
}

}  // namespace deadsimple
