#include <ciftiaxes/header.h>

#include <map>
#include <stdexcept>
#include <string>

namespace ciftiaxes {

axes::Axis parseAxis(const mapping::MatrixIndicesMap& mim)
{
  switch (mim.indices_map_to_data_type)
  {
#define X(type, axis)                                                                                                  \
  case mapping::IndexType::type:                                                                                       \
    return axes::axis::fromMapping(mim);
    CIFTIAXES_AXIS_PARSERS(X)
#undef X
  }
  throw std::invalid_argument("Unsupported IndicesMapToDataType " +
                              std::to_string(static_cast<int>(mim.indices_map_to_data_type)));
}

mapping::Matrix assembleHeader(const std::vector<axes::AxisPtr>& axes)
{
  mapping::Matrix matrix;
  std::vector<mapping::MatrixIndicesMapPtr> per_dim;
  per_dim.reserve(axes.size());

  for (std::size_t dim = 0; dim < axes.size(); ++dim)
  {
    const axes::AxisPtr& axis = axes[dim];
    if (!axis)
      throw std::invalid_argument("No axis given for dimension " + std::to_string(dim));

    mapping::MatrixIndicesMapPtr reused;
    for (std::size_t prev = 0; prev < dim; ++prev)
    {
      if (axes[prev].get() == axis.get())
      {
        reused = per_dim[prev];
        break;
      }
    }

    if (reused)
    {
      reused->applies_to_matrix_dimension.push_back(static_cast<int>(dim));
      per_dim.push_back(reused);
    }
    else
    {
      auto mim = std::make_shared<mapping::MatrixIndicesMap>(axes::toMapping(*axis, static_cast<int>(dim)));
      per_dim.push_back(mim);
      matrix.maps.push_back(mim);
    }
  }
  return matrix;
}

std::vector<axes::AxisPtr> axesFromMatrix(const mapping::Matrix& matrix)
{
  std::map<const mapping::MatrixIndicesMap*, axes::AxisPtr> parsed;
  std::vector<axes::AxisPtr> out;

  const int ndim = matrix.numDimensions();
  for (int dim = 0; dim < ndim; ++dim)
  {
    const mapping::MatrixIndicesMap* mim = matrix.getIndexMap(dim);
    if (!mim)
      throw std::runtime_error("No MatrixIndicesMap applies to matrix dimension " + std::to_string(dim));

    auto it = parsed.find(mim);
    if (it == parsed.end())
      it = parsed.emplace(mim, axes::makeAxis(parseAxis(*mim))).first;
    out.push_back(it->second);
  }
  return out;
}

}  // namespace ciftiaxes
