#ifndef CIFTIAXES_AXES_GEOMETRY_H_
#define CIFTIAXES_AXES_GEOMETRY_H_

#include <map>
#include <optional>
#include <string>

#include <Eigen/Core>

#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace axes {

constexpr double kAffineTolerance = 1e-8;
constexpr int kVolumeMeterExponent = -3;

/// Number of vertices of every surface structure referenced by an axis.
using VertexCounts = std::map<std::string, int>;

/**
 * @brief Volume in which the voxels of a BrainModel or Parcels axis are defined.
 *
 * Either both members are set (the axis has voxels) or neither is.
 */
struct VolumeGeometry
{
  std::optional<Eigen::Matrix4d> affine;       // voxel indices -> mm
  std::optional<Eigen::Vector3i> volume_shape;

  bool empty() const
  {
    return !affine && !volume_shape;
  }
};

/// Equality used by the axes: affines within kAffineTolerance, identical shapes.
bool geometryEqual(const VolumeGeometry& a, const VolumeGeometry& b);

/**
 * @brief Geometry of the concatenation of two axes.
 *
 * An empty side adopts the other one; two non-empty sides must match exactly.
 * @throws IncompatibleGeometry
 */
VolumeGeometry mergeGeometry(const VolumeGeometry& a, const VolumeGeometry& b, const std::string& what);

/// Union of two vertex count tables, @throws InconsistentVertexCount on conflicting counts.
VertexCounts mergeVertexCounts(const VertexCounts& a, const VertexCounts& b, const std::string& what);

/// Checks that a geometry needed by voxels is complete, @throws IncompatibleGeometry.
void requireGeometry(const VolumeGeometry& geometry, const std::string& what);

mapping::Volume toVolume(const VolumeGeometry& geometry);
VolumeGeometry fromVolume(const std::optional<mapping::Volume>& volume);

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_GEOMETRY_H_
