#pragma once

#include <concepts>
#include <string>

template <typename T>
std::string to_str(const T& t);

template <typename Str>
  requires std::constructible_from<std::string, Str>
std::string to_str(const Str& str) {
  return std::string{str};
}
