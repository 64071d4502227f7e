#ifndef CIFTIAXES_AXES_SELECTOR_H_
#define CIFTIAXES_AXES_SELECTOR_H_

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ciftiaxes {
namespace axes {

/// Single row/column; negative values count from the end.
struct ByIndex
{
  std::ptrdiff_t index = 0;
};

/// Slice [start:stop:step]; negative bounds count from the end, missing bounds select to the end in the step direction.
struct ByRange
{
  std::optional<std::ptrdiff_t> start;
  std::optional<std::ptrdiff_t> stop;
  std::ptrdiff_t step = 1;
};

/// Arbitrary rows/columns, in the given order.
struct ByIndices
{
  std::vector<std::ptrdiff_t> indices;
};

/// Parcel lookup by name (Parcels axis only).
struct ByName
{
  std::string name;
};

using Selector = std::variant<ByIndex, ByRange, ByIndices, ByName>;

// Normalized slice over a sequence of known size
struct SliceIndices
{
  std::ptrdiff_t start = 0;
  std::ptrdiff_t step = 1;
  std::size_t count = 0;

  std::vector<std::size_t> positions() const;
};

SliceIndices resolveSlice(const ByRange& range, std::size_t size);

/// Converts a possibly negative index to a position, throws IndexOutOfRange.
std::size_t resolveIndex(std::ptrdiff_t index, std::size_t size);

std::vector<std::size_t> resolveIndices(const ByIndices& selector, std::size_t size);

template <class T>
std::vector<T> gather(const std::vector<T>& values, const std::vector<std::size_t>& positions)
{
  std::vector<T> out;
  out.reserve(positions.size());
  for (std::size_t pos : positions)
    out.push_back(values[pos]);
  return out;
}

template <class T>
std::vector<T> append(std::vector<T> first, const std::vector<T>& second)
{
  first.insert(first.end(), second.begin(), second.end());
  return first;
}

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_SELECTOR_H_
