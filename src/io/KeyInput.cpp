/* @file KeyInput.cpp
 * @brief key name normalization
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cctype>

// Dahu headers
#include "io/KeyInput.hpp"

using namespace dahu::io;

std::string KeyInput::normalize(const std::string& key) {
  std::size_t first = 0;
  std::size_t last = key.size();
  while (first < last && std::isspace(static_cast<unsigned char>(key[first])))
    ++first;
  while (last > first && std::isspace(static_cast<unsigned char>(key[last - 1])))
    --last;

  std::string out;
  out.reserve(last - first);
  for (std::size_t i = first; i < last; ++i)
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(key[i]))));
  return out;
}
