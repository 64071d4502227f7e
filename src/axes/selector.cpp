#include <ciftiaxes/axes/selector.h>
#include <ciftiaxes/errors.h>

namespace ciftiaxes {
namespace axes {

std::vector<std::size_t> SliceIndices::positions() const
{
  std::vector<std::size_t> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
    out.push_back(static_cast<std::size_t>(start + static_cast<std::ptrdiff_t>(i) * step));
  return out;
}

SliceIndices resolveSlice(const ByRange& range, std::size_t size)
{
  if (range.step == 0)
    throw UnsupportedIndex("Slice step cannot be zero");

  const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(size);
  const std::ptrdiff_t step = range.step;

  auto clamp = [&](std::ptrdiff_t x) {
    if (x < 0)
    {
      x += n;
      if (x < 0)
        x = step < 0 ? -1 : 0;
    }
    else if (x >= n)
    {
      x = step < 0 ? n - 1 : n;
    }
    return x;
  };

  const std::ptrdiff_t start = range.start ? clamp(*range.start) : (step < 0 ? n - 1 : 0);
  const std::ptrdiff_t stop = range.stop ? clamp(*range.stop) : (step < 0 ? -1 : n);

  SliceIndices out;
  out.start = start;
  out.step = step;
  if (step > 0 && start < stop)
    out.count = static_cast<std::size_t>((stop - start - 1) / step + 1);
  else if (step < 0 && stop < start)
    out.count = static_cast<std::size_t>((start - stop - 1) / (-step) + 1);
  return out;
}

std::size_t resolveIndex(std::ptrdiff_t index, std::size_t size)
{
  const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(size);
  const std::ptrdiff_t pos = index < 0 ? index + n : index;
  if (pos < 0 || pos >= n)
    throw IndexOutOfRange("Index " + std::to_string(index) + " is out of range for axis with size " +
                          std::to_string(size));
  return static_cast<std::size_t>(pos);
}

std::vector<std::size_t> resolveIndices(const ByIndices& selector, std::size_t size)
{
  std::vector<std::size_t> out;
  out.reserve(selector.indices.size());
  for (std::ptrdiff_t index : selector.indices)
    out.push_back(resolveIndex(index, size));
  return out;
}

}  // namespace axes
}  // namespace ciftiaxes
