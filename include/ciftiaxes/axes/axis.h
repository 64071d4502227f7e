#ifndef CIFTIAXES_AXES_AXIS_H_
#define CIFTIAXES_AXES_AXIS_H_

#include <memory>
#include <optional>
#include <utility>
#include <variant>

#include <ciftiaxes/axes/brain_model.h>
#include <ciftiaxes/axes/label.h>
#include <ciftiaxes/axes/parcels.h>
#include <ciftiaxes/axes/scalar.h>
#include <ciftiaxes/axes/selector.h>
#include <ciftiaxes/axes/series.h>
#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace axes {

/// Description of the rows or columns of a CIFTI matrix.
using Axis = std::variant<Series, Scalar, Label, BrainModel, Parcels>;

/// Shared handle; header assembly deduplicates axes by handle identity.
using AxisPtr = std::shared_ptr<const Axis>;

/// Description of a single row/column, one alternative per axis kind (in Axis order).
using Element = std::variant<double, ScalarElement, LabelElement, BrainModelElement, ParcelElement>;

/// Result of index(): a single element for ByIndex/ByName, a new axis otherwise.
using IndexResult = std::variant<Element, Axis>;

template <class... Ts>
AxisPtr makeAxis(Ts&&... args)
{
  return std::make_shared<Axis>(std::forward<Ts>(args)...);
}

std::size_t size(const Axis& axis);

mapping::IndexType indexType(const Axis& axis);

/// False for different axis kinds or any difference in content, never throws.
bool equals(const Axis& a, const Axis& b);

/**
 * @brief Appends `b` to `a`.
 *
 * @return std::nullopt when the axes are of different kinds, so callers can try
 *         another way of combining them.
 * @throws IncompatibleAxes, IncompatibleGeometry, InconsistentVertexCount for
 *         axes of the same kind that cannot be combined.
 */
std::optional<Axis> concat(const Axis& a, const Axis& b);

/**
 * @brief Selects part of an axis.
 *
 * @throws IndexOutOfRange, UnsupportedIndex (ByName on anything but Parcels, ByIndices on Series),
 *         ParcelNotFound, AmbiguousParcelName
 */
IndexResult index(const Axis& axis, const Selector& selector);

/// Convenience wrapper around index() for selectors returning a sub-axis.
Axis subAxis(const Axis& axis, const Selector& selector);

mapping::MatrixIndicesMap toMapping(const Axis& axis, int dim);

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_AXIS_H_
