#include <ciftiaxes/axes/axis.h>
#include <ciftiaxes/errors.h>

#include <type_traits>

namespace ciftiaxes {
namespace axes {

namespace {

template <class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <class T>
const char* axisName()
{
  if constexpr (std::is_same_v<T, Series>)
    return "Series";
  else if constexpr (std::is_same_v<T, Scalar>)
    return "Scalar";
  else if constexpr (std::is_same_v<T, Label>)
    return "Label";
  else if constexpr (std::is_same_v<T, BrainModel>)
    return "BrainModel";
  else
    return "Parcels";
}

template <class T>
IndexResult indexAxis(const T& axis, const Selector& selector)
{
  return std::visit(
      overloaded{
          [&](const ByIndex& s) -> IndexResult { return Element(axis.element(s.index)); },
          [&](const ByRange& s) -> IndexResult { return Axis(axis.slice(s)); },
          [&](const ByIndices& s) -> IndexResult {
            if constexpr (std::is_same_v<T, Series>)
              throw UnsupportedIndex("Series can only be indexed with integers or slices without breaking the "
                                     "regular structure");
            else
              return Axis(axis.take(resolveIndices(s, axis.size())));
          },
          [&](const ByName& s) -> IndexResult {
            if constexpr (std::is_same_v<T, Parcels>)
              return Element(axis.find(s.name));
            else
              throw UnsupportedIndex(std::string("Can not index a ") + axisName<T>() +
                                     " axis with a name (only Parcels support lookup by name)");
          },
      },
      selector);
}

}  // namespace

std::size_t size(const Axis& axis)
{
  return std::visit([](const auto& a) { return a.size(); }, axis);
}

mapping::IndexType indexType(const Axis& axis)
{
  return std::visit(overloaded{
                        [](const Series&) { return mapping::IndexType::Series; },
                        [](const Scalar&) { return mapping::IndexType::Scalars; },
                        [](const Label&) { return mapping::IndexType::Labels; },
                        [](const BrainModel&) { return mapping::IndexType::BrainModels; },
                        [](const Parcels&) { return mapping::IndexType::Parcels; },
                    },
                    axis);
}

bool equals(const Axis& a, const Axis& b)
{
  return a == b;
}

std::optional<Axis> concat(const Axis& a, const Axis& b)
{
  return std::visit(
      [](const auto& lhs, const auto& rhs) -> std::optional<Axis> {
        using L = std::decay_t<decltype(lhs)>;
        using R = std::decay_t<decltype(rhs)>;
        if constexpr (std::is_same_v<L, R>)
          return Axis(lhs.concat(rhs));
        else
          return std::nullopt;
      },
      a, b);
}

IndexResult index(const Axis& axis, const Selector& selector)
{
  return std::visit([&](const auto& a) { return indexAxis(a, selector); }, axis);
}

Axis subAxis(const Axis& axis, const Selector& selector)
{
  IndexResult result = index(axis, selector);
  if (auto* sub = std::get_if<Axis>(&result))
    return std::move(*sub);
  throw UnsupportedIndex("Selector returns a single element, not an axis");
}

mapping::MatrixIndicesMap toMapping(const Axis& axis, int dim)
{
  return std::visit([dim](const auto& a) { return a.toMapping(dim); }, axis);
}

}  // namespace axes
}  // namespace ciftiaxes
