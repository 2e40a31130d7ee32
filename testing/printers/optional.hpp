#pragma once

#include <optional>
#include <string>

#include <catch2/catch_tostring.hpp>

namespace Catch {
template <typename T>
struct StringMaker<std::optional<T>> {
  static std::string convert(const std::optional<T>& val) {
    if (val.has_value())
      return "optional(" + Catch::Detail::stringify(val.value()) + ')';
    else
      return "nullopt";
  }
};
} // namespace Catch
