#ifndef CIFTIAXES_MAPPING_MATRIX_INDICES_MAP_H_
#define CIFTIAXES_MAPPING_MATRIX_INDICES_MAP_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

namespace ciftiaxes {
namespace mapping {

// Ordered key/value pairs, as stored in <MetaData>
using MetaData = std::vector<std::pair<std::string, std::string>>;

enum class IndexType
{
  Scalars,
  Labels,
  Series,
  BrainModels,
  Parcels,
};

enum class ModelType
{
  Surface,
  Voxels,
};

// IndicesMapToDataType attribute values
std::string indexTypeToString(IndexType type);
IndexType indexTypeFromString(const std::string& str);

std::string modelTypeToString(ModelType type);
ModelType modelTypeFromString(const std::string& str);

struct LabelTableEntry
{
  std::int64_t key = 0;
  std::string label;
  double red = 0.0;
  double green = 0.0;
  double blue = 0.0;
  double alpha = 0.0;
};

struct NamedMap
{
  std::string map_name;
  MetaData metadata;
  std::optional<std::vector<LabelTableEntry>> label_table;  // only for label maps
};

struct BrainModelEntry
{
  std::int64_t index_offset = 0;
  std::int64_t index_count = 0;
  ModelType model_type = ModelType::Surface;
  std::string brain_structure;
  std::optional<int> surface_number_of_vertices;  // surface models only
  std::vector<int> vertex_indices;
  std::vector<Eigen::Vector3i> voxel_indices_ijk;
};

struct Surface
{
  std::string brain_structure;
  int surface_number_of_vertices = 0;
};

struct ParcelVertices
{
  std::string brain_structure;
  std::vector<int> indices;
};

struct Parcel
{
  std::string name;
  std::vector<Eigen::Vector3i> voxel_indices_ijk;
  std::vector<ParcelVertices> vertices;
};

struct Volume
{
  Eigen::Vector3i volume_dimensions = Eigen::Vector3i::Zero();
  int meter_exponent = -3;  // transform maps voxel indices to 10^meter_exponent meters
  Eigen::Matrix4d transform = Eigen::Matrix4d::Identity();
};

/**
 * @brief On-disk description of one or more dimensions of the data matrix.
 *
 * Only the members relevant to @ref indices_map_to_data_type are filled.
 */
struct MatrixIndicesMap
{
  std::vector<int> applies_to_matrix_dimension;
  IndexType indices_map_to_data_type = IndexType::Scalars;

  // Series
  std::optional<std::int64_t> number_of_series_points;
  std::optional<int> series_exponent;
  std::optional<double> series_start;
  std::optional<double> series_step;
  std::optional<std::string> series_unit;

  // Scalars, Labels
  std::vector<NamedMap> named_maps;

  // BrainModels
  std::vector<BrainModelEntry> brain_models;

  // Parcels
  std::vector<Surface> surfaces;
  std::vector<Parcel> parcels;

  // BrainModels, Parcels
  std::optional<Volume> volume;
};

using MatrixIndicesMapPtr = std::shared_ptr<MatrixIndicesMap>;

/// Content of the <Matrix> element. A map may apply to several dimensions.
struct Matrix
{
  MetaData metadata;
  std::vector<MatrixIndicesMapPtr> maps;

  /// Map describing dimension `dim`, nullptr if none does.
  const MatrixIndicesMap* getIndexMap(int dim) const;

  /// Number of dimensions covered by the maps (highest dimension + 1).
  int numDimensions() const;
};

}  // namespace mapping
}  // namespace ciftiaxes

#endif  // CIFTIAXES_MAPPING_MATRIX_INDICES_MAP_H_
