#ifndef CIFTIAXES_AXES_PARCELS_H_
#define CIFTIAXES_AXES_PARCELS_H_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include <ciftiaxes/axes/brain_model.h>
#include <ciftiaxes/axes/geometry.h>
#include <ciftiaxes/axes/selector.h>
#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace axes {

/// Vertex indices of a parcel per surface structure.
using VertexMap = std::map<std::string, std::vector<int>>;

struct ParcelElement
{
  std::string name;
  std::vector<Eigen::Vector3i> voxels;
  VertexMap vertices;
};

/**
 * @brief Each row/column is a parcel: a named set of voxels and surface vertices.
 *
 * Parcel names are not required to be unique, but find() only succeeds for
 * names that are.
 */
class Parcels
{
public:
  /// @throws ShapeMismatch, InvalidStructureName, InconsistentVertexCount, UndefinedIndices, IncompatibleGeometry
  Parcels(std::vector<std::string> name, std::vector<std::vector<Eigen::Vector3i>> voxels,
          std::vector<VertexMap> vertices, VolumeGeometry geometry = {}, VertexCounts nvertices = {});

  /// One parcel per (parcel name, greyordinates) pair.
  static Parcels fromBrainModels(const std::vector<std::pair<std::string, BrainModel>>& named_models);

  static Parcels fromMapping(const mapping::MatrixIndicesMap& mim);
  mapping::MatrixIndicesMap toMapping(int dim) const;

  std::size_t size() const
  {
    return name_.size();
  }
  const std::vector<std::string>& name() const
  {
    return name_;
  }
  const std::vector<std::vector<Eigen::Vector3i>>& voxels() const
  {
    return voxels_;
  }
  const std::vector<VertexMap>& vertices() const
  {
    return vertices_;
  }
  const VolumeGeometry& geometry() const
  {
    return geometry_;
  }
  const std::optional<Eigen::Matrix4d>& affine() const
  {
    return geometry_.affine;
  }
  const std::optional<Eigen::Vector3i>& volumeShape() const
  {
    return geometry_.volume_shape;
  }
  const VertexCounts& nvertices() const
  {
    return nvertices_;
  }

  ParcelElement element(std::ptrdiff_t index) const;

  /// @throws ParcelNotFound, AmbiguousParcelName
  ParcelElement find(const std::string& name) const;

  Parcels slice(const ByRange& range) const;
  Parcels take(const std::vector<std::size_t>& positions) const;

  /// @throws IncompatibleGeometry, InconsistentVertexCount
  Parcels concat(const Parcels& other) const;

  bool operator==(const Parcels& other) const;
  bool operator!=(const Parcels& other) const
  {
    return !(*this == other);
  }

private:
  std::vector<std::string> name_;
  std::vector<std::vector<Eigen::Vector3i>> voxels_;
  std::vector<VertexMap> vertices_;
  VolumeGeometry geometry_;
  VertexCounts nvertices_;
};

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_PARCELS_H_
