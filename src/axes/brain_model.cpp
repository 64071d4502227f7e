#include <ciftiaxes/axes/brain_model.h>
#include <ciftiaxes/errors.h>
#include <ciftiaxes/structure_name.h>

#include <algorithm>

namespace ciftiaxes {
namespace axes {

BrainModel::BrainModel(std::vector<std::string> name, std::vector<Eigen::Vector3i> voxel, std::vector<int> vertex,
                       VolumeGeometry geometry, VertexCounts nvertices)
  : name_(std::move(name)), voxel_(std::move(voxel)), vertex_(std::move(vertex))
{
  if (voxel_.size() != name_.size())
    throw ShapeMismatch("Input voxel has incorrect size (" + std::to_string(voxel_.size()) +
                        ") for BrainModel axis of size " + std::to_string(name_.size()));
  if (vertex_.size() != name_.size())
    throw ShapeMismatch("Input vertex has incorrect size (" + std::to_string(vertex_.size()) +
                        ") for BrainModel axis of size " + std::to_string(name_.size()));

  for (auto& n : name_)
    n = toStructureName(n);

  // keep the vertex counts of the surface structures actually present
  for (const auto& [structure, count] : nvertices)
  {
    const std::string canonical = toStructureName(structure);
    if (std::find(name_.begin(), name_.end(), canonical) != name_.end())
      nvertices_[canonical] = count;
  }

  bool has_volume = false;
  for (std::size_t i = 0; i < size(); ++i)
  {
    if (isSurface(i))
    {
      if (vertex_[i] < 0)
        throw UndefinedIndices("Undefined vertex index found for surface element " + std::to_string(i) + " (" +
                               name_[i] + ")");
    }
    else
    {
      has_volume = true;
      if ((voxel_[i].array() < 0).any())
        throw UndefinedIndices("Undefined voxel indices found for volumetric element " + std::to_string(i) + " (" +
                               name_[i] + ")");
    }
  }

  if (has_volume)
  {
    requireGeometry(geometry, "BrainModel");
    geometry_ = std::move(geometry);
  }
}

BrainModel BrainModel::fromSurface(const std::vector<int>& vertices, int nvertex, const std::string& name)
{
  const std::string structure = toStructureName(name);
  return BrainModel(std::vector<std::string>(vertices.size(), structure),
                    std::vector<Eigen::Vector3i>(vertices.size(), Eigen::Vector3i::Constant(-1)), vertices, {},
                    { { structure, nvertex } });
}

BrainModel BrainModel::fromMask(const Mask& mask, const std::string& name, const Eigen::Matrix4d& affine)
{
  if (mask.shape.size() != 1 && mask.shape.size() != 3)
    throw InvalidMaskRank("Mask should be either 1-dimensional (for surfaces) or 3-dimensional (for volumes), not " +
                          std::to_string(mask.shape.size()) + "-dimensional");

  std::size_t nvalues = 1;
  for (int extent : mask.shape)
  {
    if (extent < 0)
      throw ShapeMismatch("Mask shape cannot contain negative extents");
    nvalues *= static_cast<std::size_t>(extent);
  }
  if (nvalues != mask.values.size())
    throw ShapeMismatch("Mask has " + std::to_string(mask.values.size()) + " values but its shape holds " +
                        std::to_string(nvalues));

  if (mask.shape.size() == 1)
  {
    std::vector<int> vertices;
    for (std::size_t i = 0; i < mask.values.size(); ++i)
      if (mask.values[i] != 0)
        vertices.push_back(static_cast<int>(i));
    return fromSurface(vertices, mask.shape[0], name);
  }

  const std::size_t ny = static_cast<std::size_t>(mask.shape[1]);
  const std::size_t nz = static_cast<std::size_t>(mask.shape[2]);
  std::vector<Eigen::Vector3i> voxels;
  for (std::size_t flat = 0; flat < mask.values.size(); ++flat)
  {
    if (mask.values[flat] == 0)
      continue;
    voxels.emplace_back(static_cast<int>(flat / (ny * nz)), static_cast<int>((flat / nz) % ny),
                        static_cast<int>(flat % nz));
  }
  return fromVoxels(voxels, affine, Eigen::Vector3i(mask.shape[0], mask.shape[1], mask.shape[2]), name);
}

BrainModel BrainModel::fromVoxels(const std::vector<Eigen::Vector3i>& voxels, const Eigen::Matrix4d& affine,
                                  const Eigen::Vector3i& volume_shape, const std::string& name)
{
  VolumeGeometry geometry;
  geometry.affine = affine;
  geometry.volume_shape = volume_shape;
  return BrainModel(std::vector<std::string>(voxels.size(), toStructureName(name)), voxels,
                    std::vector<int>(voxels.size(), -1), geometry);
}

BrainModel BrainModel::fromMapping(const mapping::MatrixIndicesMap& mim)
{
  std::int64_t total = 0;
  for (const auto& bm : mim.brain_models)
    total += bm.index_count;

  std::vector<std::string> name(static_cast<std::size_t>(total));
  std::vector<Eigen::Vector3i> voxel(name.size(), Eigen::Vector3i::Constant(-1));
  std::vector<int> vertex(name.size(), -1);
  VertexCounts nvertices;
  bool has_volume = false;

  for (const auto& bm : mim.brain_models)
  {
    if (bm.index_offset < 0 || bm.index_count < 0 || bm.index_offset + bm.index_count > total)
      throw ShapeMismatch("BrainModel " + bm.brain_structure + " with offset " + std::to_string(bm.index_offset) +
                          " and count " + std::to_string(bm.index_count) + " does not fit in " +
                          std::to_string(total) + " elements");

    const std::size_t offset = static_cast<std::size_t>(bm.index_offset);
    const std::size_t count = static_cast<std::size_t>(bm.index_count);
    for (std::size_t i = offset; i < offset + count; ++i)
      name[i] = bm.brain_structure;

    if (bm.model_type == mapping::ModelType::Surface)
    {
      if (bm.vertex_indices.size() != count)
        throw ShapeMismatch("BrainModel " + bm.brain_structure + " has " + std::to_string(bm.vertex_indices.size()) +
                            " vertex indices but IndexCount " + std::to_string(count));
      if (!bm.surface_number_of_vertices)
        throw InconsistentVertexCount("Surface BrainModel " + bm.brain_structure +
                                      " does not define SurfaceNumberOfVertices");
      std::copy(bm.vertex_indices.begin(), bm.vertex_indices.end(), vertex.begin() + offset);

      auto known = nvertices.find(bm.brain_structure);
      if (known != nvertices.end() && known->second != *bm.surface_number_of_vertices)
        throw InconsistentVertexCount("Surface BrainModels for " + bm.brain_structure +
                                      " define different SurfaceNumberOfVertices (" + std::to_string(known->second) +
                                      " vs " + std::to_string(*bm.surface_number_of_vertices) + ")");
      nvertices[bm.brain_structure] = *bm.surface_number_of_vertices;
    }
    else
    {
      if (bm.voxel_indices_ijk.size() != count)
        throw ShapeMismatch("BrainModel " + bm.brain_structure + " has " +
                            std::to_string(bm.voxel_indices_ijk.size()) + " voxel indices but IndexCount " +
                            std::to_string(count));
      std::copy(bm.voxel_indices_ijk.begin(), bm.voxel_indices_ijk.end(), voxel.begin() + offset);
      has_volume = true;
    }
  }

  for (std::size_t i = 0; i < name.size(); ++i)
    if (name[i].empty())
      throw ShapeMismatch("Element " + std::to_string(i) + " is not covered by any BrainModel");

  if (has_volume && !mim.volume)
    throw IncompatibleGeometry("Voxel BrainModels require a Volume element in the MatrixIndicesMap");

  return BrainModel(std::move(name), std::move(voxel), std::move(vertex), fromVolume(mim.volume),
                    std::move(nvertices));
}

mapping::MatrixIndicesMap BrainModel::toMapping(int dim) const
{
  mapping::MatrixIndicesMap mim;
  mim.applies_to_matrix_dimension = { dim };
  mim.indices_map_to_data_type = mapping::IndexType::BrainModels;

  for (const StructureRun& run : iterStructures())
  {
    mapping::BrainModelEntry entry;
    entry.index_offset = static_cast<std::int64_t>(run.start);
    entry.index_count = static_cast<std::int64_t>(run.stop - run.start);
    entry.brain_structure = run.name;

    auto it = nvertices_.find(run.name);
    if (it != nvertices_.end())
    {
      entry.model_type = mapping::ModelType::Surface;
      entry.surface_number_of_vertices = it->second;
      entry.vertex_indices = run.model.vertex();
    }
    else
    {
      entry.model_type = mapping::ModelType::Voxels;
      entry.voxel_indices_ijk = run.model.voxel();
      if (!mim.volume)
        mim.volume = toVolume(geometry_);
    }
    mim.brain_models.push_back(std::move(entry));
  }
  return mim;
}

bool BrainModel::isSurface(std::size_t index) const
{
  return nvertices_.count(name_[index]) != 0;
}

std::vector<bool> BrainModel::surfaceMask() const
{
  std::vector<bool> mask(size());
  for (std::size_t i = 0; i < size(); ++i)
    mask[i] = isSurface(i);
  return mask;
}

std::vector<bool> BrainModel::volumeMask() const
{
  std::vector<bool> mask = surfaceMask();
  mask.flip();
  return mask;
}

BrainModelElement BrainModel::element(std::ptrdiff_t index) const
{
  const std::size_t pos = resolveIndex(index, size());
  BrainModelElement out;
  out.is_surface = isSurface(pos);
  out.vertex = vertex_[pos];
  out.voxel = voxel_[pos];
  out.name = name_[pos];
  return out;
}

BrainModel BrainModel::slice(const ByRange& range) const
{
  return take(resolveSlice(range, size()).positions());
}

BrainModel BrainModel::take(const std::vector<std::size_t>& positions) const
{
  return BrainModel(gather(name_, positions), gather(voxel_, positions), gather(vertex_, positions), geometry_,
                    nvertices_);
}

BrainModel BrainModel::concat(const BrainModel& other) const
{
  VolumeGeometry geometry = mergeGeometry(geometry_, other.geometry_, "BrainModels");
  VertexCounts nvertices = mergeVertexCounts(nvertices_, other.nvertices_, "BrainModels");
  return BrainModel(append(name_, other.name_), append(voxel_, other.voxel_), append(vertex_, other.vertex_),
                    std::move(geometry), std::move(nvertices));
}

StructureRange BrainModel::iterStructures() const&
{
  return StructureRange(*this);
}

bool BrainModel::operator==(const BrainModel& other) const
{
  if (size() != other.size())
    return false;
  if (!geometryEqual(geometry_, other.geometry_))
    return false;
  if (nvertices_ != other.nvertices_ || name_ != other.name_ || vertex_ != other.vertex_)
    return false;

  // names and nvertices agree, so both axes classify every element the same way
  for (std::size_t i = 0; i < size(); ++i)
    if (!isSurface(i) && voxel_[i] != other.voxel_[i])
      return false;
  return true;
}

StructureRange::const_iterator::const_iterator(const BrainModel* model, std::size_t start)
  : model_(model), start_(start), stop_(start)
{
  stop_ = findStop();
}

std::size_t StructureRange::const_iterator::findStop() const
{
  const auto& names = model_->name();
  std::size_t stop = start_;
  while (stop < names.size() && names[stop] == names[start_])
    ++stop;
  return stop;
}

StructureRun StructureRange::const_iterator::operator*() const
{
  ByRange range;
  range.start = static_cast<std::ptrdiff_t>(start_);
  range.stop = static_cast<std::ptrdiff_t>(stop_);
  return StructureRun{ model_->name()[start_], start_, stop_, model_->slice(range) };
}

StructureRange::const_iterator& StructureRange::const_iterator::operator++()
{
  start_ = stop_;
  stop_ = findStop();
  return *this;
}

StructureRange::const_iterator StructureRange::const_iterator::operator++(int)
{
  const_iterator previous = *this;
  ++(*this);
  return previous;
}

StructureRange::const_iterator StructureRange::begin() const
{
  return const_iterator(model_, 0);
}

StructureRange::const_iterator StructureRange::end() const
{
  return const_iterator(model_, model_->size());
}

}  // namespace axes
}  // namespace ciftiaxes
