#pragma once

#include <iterator>
#include <vector>

namespace xsel::util {

/// Concatenates per-element result sequences into one, exactly one level deep.
/// MUST keep element order and the order inside each sequence.
template <typename T>
std::vector<T> flatten(std::vector<std::vector<T>> nested) {
  std::vector<T> out;
  size_t total = 0;
  for (const auto& part : nested) total += part.size();
  out.reserve(total);
  for (auto& part : nested) {
    out.insert(out.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
  }
  return out;
}

}  // namespace xsel::util
