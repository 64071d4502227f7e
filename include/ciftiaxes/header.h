#ifndef CIFTIAXES_HEADER_H_
#define CIFTIAXES_HEADER_H_

#include <vector>

#include <ciftiaxes/axes/axis.h>
#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {

/// Axis class reading each IndicesMapToDataType
#define CIFTIAXES_AXIS_PARSERS(X)                                                                                      \
  X(Scalars, Scalar)                                                                                                   \
  X(Labels, Label)                                                                                                     \
  X(Series, Series)                                                                                                    \
  X(BrainModels, BrainModel)                                                                                           \
  X(Parcels, Parcels)

/// Builds the axis described by a MatrixIndicesMap, dispatching on its data type.
axes::Axis parseAxis(const mapping::MatrixIndicesMap& mim);

/**
 * @brief Builds the <Matrix> content describing the given axes, one per dimension.
 *
 * An axis handle repeated across dimensions is written once: the dimension is
 * added to the map created for its first occurrence. Distinct handles always get
 * their own map, even when their axes compare equal.
 *
 * @throws std::invalid_argument on a null handle.
 */
mapping::Matrix assembleHeader(const std::vector<axes::AxisPtr>& axes);

/**
 * @brief Reads back one axis per matrix dimension.
 *
 * Dimensions sharing a MatrixIndicesMap share the same axis handle.
 * @throws std::runtime_error if a dimension has no MatrixIndicesMap.
 */
std::vector<axes::AxisPtr> axesFromMatrix(const mapping::Matrix& matrix);

}  // namespace ciftiaxes

#endif  // CIFTIAXES_HEADER_H_
