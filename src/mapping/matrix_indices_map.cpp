#include <ciftiaxes/mapping/matrix_indices_map.h>

#include <algorithm>
#include <stdexcept>

namespace ciftiaxes {
namespace mapping {

std::string indexTypeToString(IndexType type)
{
  switch (type)
  {
    case IndexType::Scalars:
      return "CIFTI_INDEX_TYPE_SCALARS";
    case IndexType::Labels:
      return "CIFTI_INDEX_TYPE_LABELS";
    case IndexType::Series:
      return "CIFTI_INDEX_TYPE_SERIES";
    case IndexType::BrainModels:
      return "CIFTI_INDEX_TYPE_BRAIN_MODELS";
    case IndexType::Parcels:
      return "CIFTI_INDEX_TYPE_PARCELS";
  }
  throw std::invalid_argument("Unknown IndexType");
}

IndexType indexTypeFromString(const std::string& str)
{
  if (str == "CIFTI_INDEX_TYPE_SCALARS")
    return IndexType::Scalars;
  if (str == "CIFTI_INDEX_TYPE_LABELS")
    return IndexType::Labels;
  if (str == "CIFTI_INDEX_TYPE_SERIES")
    return IndexType::Series;
  if (str == "CIFTI_INDEX_TYPE_BRAIN_MODELS")
    return IndexType::BrainModels;
  if (str == "CIFTI_INDEX_TYPE_PARCELS")
    return IndexType::Parcels;
  throw std::invalid_argument("Unknown IndicesMapToDataType: " + str);
}

std::string modelTypeToString(ModelType type)
{
  switch (type)
  {
    case ModelType::Surface:
      return "CIFTI_MODEL_TYPE_SURFACE";
    case ModelType::Voxels:
      return "CIFTI_MODEL_TYPE_VOXELS";
  }
  throw std::invalid_argument("Unknown ModelType");
}

ModelType modelTypeFromString(const std::string& str)
{
  if (str == "CIFTI_MODEL_TYPE_SURFACE")
    return ModelType::Surface;
  if (str == "CIFTI_MODEL_TYPE_VOXELS")
    return ModelType::Voxels;
  throw std::invalid_argument("Unknown ModelType: " + str);
}

const MatrixIndicesMap* Matrix::getIndexMap(int dim) const
{
  for (const auto& mim : maps)
  {
    if (!mim)
      continue;
    const auto& dims = mim->applies_to_matrix_dimension;
    if (std::find(dims.begin(), dims.end(), dim) != dims.end())
      return mim.get();
  }
  return nullptr;
}

int Matrix::numDimensions() const
{
  int ndim = 0;
  for (const auto& mim : maps)
  {
    if (!mim)
      continue;
    for (int dim : mim->applies_to_matrix_dimension)
      ndim = std::max(ndim, dim + 1);
  }
  return ndim;
}

}  // namespace mapping
}  // namespace ciftiaxes
