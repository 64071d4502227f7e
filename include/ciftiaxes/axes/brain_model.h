#ifndef CIFTIAXES_AXES_BRAIN_MODEL_H_
#define CIFTIAXES_AXES_BRAIN_MODEL_H_

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

#include <Eigen/Core>

#include <ciftiaxes/axes/geometry.h>
#include <ciftiaxes/axes/selector.h>
#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace axes {

constexpr const char* kDefaultSurfaceStructure = "Cortex";
constexpr const char* kDefaultMaskStructure = "other";

/// Description of a single greyordinate.
struct BrainModelElement
{
  bool is_surface = false;
  int vertex = -1;                                // -1 for voxels
  Eigen::Vector3i voxel{ -1, -1, -1 };            // (-1, -1, -1) for vertices
  std::string name;
};

/// N-dimensional array of values in row-major (C) order; non-zero values are selected.
struct Mask
{
  std::vector<int> shape;
  std::vector<double> values;
};

class StructureRange;

/**
 * @brief Each row/column is a single surface vertex or volume voxel.
 *
 * An element lies on the surface if its structure appears in nvertices(). Surface
 * elements need a vertex index, volumetric elements a voxel index; the other index
 * holds the -1 sentinel. Volumetric elements share one volume geometry.
 */
class BrainModel
{
public:
  /**
   * @param name structure of each element, converted with toStructureName()
   * @param voxel voxel indices, (-1, -1, -1) for surface elements
   * @param vertex vertex indices, -1 for volumetric elements
   * @param geometry volume of the voxels, required when any element is volumetric
   * @param nvertices number of vertices of each surface structure
   *
   * @throws ShapeMismatch, InvalidStructureName, IncompatibleGeometry, UndefinedIndices
   */
  BrainModel(std::vector<std::string> name, std::vector<Eigen::Vector3i> voxel, std::vector<int> vertex,
             VolumeGeometry geometry = {}, VertexCounts nvertices = {});

  /// Vertices `vertices` of a surface with `nvertex` vertices in total.
  static BrainModel fromSurface(const std::vector<int>& vertices, int nvertex,
                                const std::string& name = kDefaultSurfaceStructure);

  /**
   * @brief All non-zero elements of a 1D (surface) or 3D (volume) mask.
   *
   * `affine` is ignored for surface masks.
   * @throws InvalidMaskRank for any other number of dimensions.
   */
  static BrainModel fromMask(const Mask& mask, const std::string& name = kDefaultMaskStructure,
                             const Eigen::Matrix4d& affine = Eigen::Matrix4d::Identity());

  static BrainModel fromVoxels(const std::vector<Eigen::Vector3i>& voxels, const Eigen::Matrix4d& affine,
                               const Eigen::Vector3i& volume_shape, const std::string& name = kDefaultMaskStructure);

  static BrainModel fromMapping(const mapping::MatrixIndicesMap& mim);
  mapping::MatrixIndicesMap toMapping(int dim) const;

  std::size_t size() const
  {
    return name_.size();
  }
  const std::vector<std::string>& name() const
  {
    return name_;
  }
  const std::vector<Eigen::Vector3i>& voxel() const
  {
    return voxel_;
  }
  const std::vector<int>& vertex() const
  {
    return vertex_;
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

  bool isSurface(std::size_t index) const;
  std::vector<bool> surfaceMask() const;
  std::vector<bool> volumeMask() const;

  BrainModelElement element(std::ptrdiff_t index) const;
  BrainModel slice(const ByRange& range) const;
  BrainModel take(const std::vector<std::size_t>& positions) const;

  /// @throws IncompatibleGeometry, InconsistentVertexCount
  BrainModel concat(const BrainModel& other) const;

  /// Maximal runs of consecutive elements belonging to the same structure.
  StructureRange iterStructures() const&;
  // the range refers to this axis, which must outlive it
  StructureRange iterStructures() && = delete;

  bool operator==(const BrainModel& other) const;
  bool operator!=(const BrainModel& other) const
  {
    return !(*this == other);
  }

private:
  std::vector<std::string> name_;
  std::vector<Eigen::Vector3i> voxel_;
  std::vector<int> vertex_;
  VolumeGeometry geometry_;
  VertexCounts nvertices_;
};

struct StructureRun
{
  std::string name;
  std::size_t start = 0;  // first element
  std::size_t stop = 0;   // one past the last element
  BrainModel model;       // elements [start, stop)
};

/**
 * @brief Lazy sequence of StructureRun over a BrainModel.
 *
 * Runs are found while iterating and may be iterated again. The BrainModel must
 * outlive the range and its iterators, so ranges are only handed out for named
 * models.
 */
class StructureRange
{
public:
  class const_iterator
  {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = StructureRun;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = StructureRun;

    const_iterator(const BrainModel* model, std::size_t start);

    StructureRun operator*() const;
    const_iterator& operator++();
    const_iterator operator++(int);

    bool operator==(const const_iterator& other) const
    {
      return model_ == other.model_ && start_ == other.start_;
    }
    bool operator!=(const const_iterator& other) const
    {
      return !(*this == other);
    }

  private:
    std::size_t findStop() const;

    const BrainModel* model_;
    std::size_t start_;
    std::size_t stop_;
  };

  explicit StructureRange(const BrainModel& model) : model_(&model)
  {
  }

  const_iterator begin() const;
  const_iterator end() const;

private:
  const BrainModel* model_;
};

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_BRAIN_MODEL_H_
