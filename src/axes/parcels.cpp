#include <ciftiaxes/axes/parcels.h>
#include <ciftiaxes/errors.h>
#include <ciftiaxes/structure_name.h>

namespace ciftiaxes {
namespace axes {

Parcels::Parcels(std::vector<std::string> name, std::vector<std::vector<Eigen::Vector3i>> voxels,
                 std::vector<VertexMap> vertices, VolumeGeometry geometry, VertexCounts nvertices)
  : name_(std::move(name)), voxels_(std::move(voxels))
{
  if (voxels_.size() != name_.size())
    throw ShapeMismatch("Input voxels has incorrect size (" + std::to_string(voxels_.size()) +
                        ") for Parcels axis of size " + std::to_string(name_.size()));
  if (vertices.size() != name_.size())
    throw ShapeMismatch("Input vertices has incorrect size (" + std::to_string(vertices.size()) +
                        ") for Parcels axis of size " + std::to_string(name_.size()));

  VertexCounts declared;
  for (const auto& [structure, count] : nvertices)
    declared[toStructureName(structure)] = count;

  vertices_.reserve(vertices.size());
  for (std::size_t i = 0; i < vertices.size(); ++i)
  {
    VertexMap parcel_vertices;
    for (auto& [structure, indices] : vertices[i])
    {
      const std::string canonical = toStructureName(structure);
      auto it = declared.find(canonical);
      if (it == declared.end())
        throw InconsistentVertexCount("Number of vertices for surface structure " + canonical +
                                      " not defined (parcel '" + name_[i] + "')");
      for (int v : indices)
        if (v < 0)
          throw UndefinedIndices("Negative vertex index in parcel '" + name_[i] + "' for " + canonical);

      nvertices_[canonical] = it->second;
      auto& out = parcel_vertices[canonical];
      out.insert(out.end(), indices.begin(), indices.end());
    }
    vertices_.push_back(std::move(parcel_vertices));
  }

  bool has_volume = false;
  for (std::size_t i = 0; i < voxels_.size(); ++i)
  {
    for (const auto& voxel : voxels_[i])
      if ((voxel.array() < 0).any())
        throw UndefinedIndices("Negative voxel index in parcel '" + name_[i] + "'");
    has_volume = has_volume || !voxels_[i].empty();
  }

  if (has_volume)
  {
    requireGeometry(geometry, "Parcels");
    geometry_ = std::move(geometry);
  }
}

Parcels Parcels::fromBrainModels(const std::vector<std::pair<std::string, BrainModel>>& named_models)
{
  VolumeGeometry geometry;
  VertexCounts nvertices;
  std::vector<std::string> names;
  std::vector<std::vector<Eigen::Vector3i>> all_voxels;
  std::vector<VertexMap> all_vertices;

  for (const auto& [parcel_name, bm] : named_models)
  {
    names.push_back(parcel_name);

    std::vector<Eigen::Vector3i> voxels;
    for (std::size_t i = 0; i < bm.size(); ++i)
      if (!bm.isSurface(i))
        voxels.push_back(bm.voxel()[i]);

    if (!voxels.empty())
    {
      if (geometry.empty())
        geometry = bm.geometry();
      else if (*geometry.affine != *bm.affine() || *geometry.volume_shape != *bm.volumeShape())
        throw IncompatibleGeometry("Can not combine brain models defined in different volumes into a single "
                                   "Parcels axis (parcel '" +
                                   parcel_name + "')");
    }
    all_voxels.push_back(std::move(voxels));

    VertexMap vertices;
    for (const StructureRun& run : bm.iterStructures())
    {
      auto count = bm.nvertices().find(run.name);
      if (count == bm.nvertices().end())
        continue;

      auto known = nvertices.find(run.name);
      if (known != nvertices.end() && known->second != count->second)
        throw InconsistentVertexCount("Got multiple conflicting number of vertices for surface structure " +
                                      run.name + " (" + std::to_string(known->second) + " vs " +
                                      std::to_string(count->second) + ")");
      nvertices[run.name] = count->second;

      auto& out = vertices[run.name];
      out.insert(out.end(), run.model.vertex().begin(), run.model.vertex().end());
    }
    all_vertices.push_back(std::move(vertices));
  }

  return Parcels(std::move(names), std::move(all_voxels), std::move(all_vertices), std::move(geometry),
                 std::move(nvertices));
}

Parcels Parcels::fromMapping(const mapping::MatrixIndicesMap& mim)
{
  VertexCounts nvertices;
  for (const auto& surface : mim.surfaces)
    nvertices[surface.brain_structure] = surface.surface_number_of_vertices;

  std::vector<std::string> names;
  std::vector<std::vector<Eigen::Vector3i>> all_voxels;
  std::vector<VertexMap> all_vertices;
  for (const auto& parcel : mim.parcels)
  {
    names.push_back(parcel.name);
    all_voxels.push_back(parcel.voxel_indices_ijk);

    VertexMap vertices;
    for (const auto& pv : parcel.vertices)
    {
      if (nvertices.count(pv.brain_structure) == 0)
        throw InconsistentVertexCount("Number of vertices for surface structure " + pv.brain_structure +
                                      " not defined");
      auto& out = vertices[pv.brain_structure];
      out.insert(out.end(), pv.indices.begin(), pv.indices.end());
    }
    all_vertices.push_back(std::move(vertices));
  }

  return Parcels(std::move(names), std::move(all_voxels), std::move(all_vertices), fromVolume(mim.volume),
                 std::move(nvertices));
}

mapping::MatrixIndicesMap Parcels::toMapping(int dim) const
{
  mapping::MatrixIndicesMap mim;
  mim.applies_to_matrix_dimension = { dim };
  mim.indices_map_to_data_type = mapping::IndexType::Parcels;

  if (!geometry_.empty())
    mim.volume = toVolume(geometry_);

  for (const auto& [structure, count] : nvertices_)
    mim.surfaces.push_back({ structure, count });

  for (std::size_t i = 0; i < size(); ++i)
  {
    mapping::Parcel parcel;
    parcel.name = name_[i];
    parcel.voxel_indices_ijk = voxels_[i];
    for (const auto& [structure, indices] : vertices_[i])
      parcel.vertices.push_back({ structure, indices });
    mim.parcels.push_back(std::move(parcel));
  }
  return mim;
}

ParcelElement Parcels::element(std::ptrdiff_t index) const
{
  const std::size_t pos = resolveIndex(index, size());
  return { name_[pos], voxels_[pos], vertices_[pos] };
}

ParcelElement Parcels::find(const std::string& name) const
{
  std::size_t found = size();
  std::size_t matches = 0;
  for (std::size_t i = 0; i < size(); ++i)
  {
    if (name_[i] != name)
      continue;
    found = i;
    ++matches;
  }

  if (matches == 0)
    throw ParcelNotFound("Parcel '" + name + "' not found");
  if (matches > 1)
    throw AmbiguousParcelName("Multiple parcels with name '" + name + "' found (" + std::to_string(matches) + ")");
  return { name_[found], voxels_[found], vertices_[found] };
}

Parcels Parcels::slice(const ByRange& range) const
{
  return take(resolveSlice(range, size()).positions());
}

Parcels Parcels::take(const std::vector<std::size_t>& positions) const
{
  return Parcels(gather(name_, positions), gather(voxels_, positions), gather(vertices_, positions), geometry_,
                 nvertices_);
}

Parcels Parcels::concat(const Parcels& other) const
{
  VolumeGeometry geometry = mergeGeometry(geometry_, other.geometry_, "Parcels");
  VertexCounts nvertices = mergeVertexCounts(nvertices_, other.nvertices_, "Parcels");
  return Parcels(append(name_, other.name_), append(voxels_, other.voxels_), append(vertices_, other.vertices_),
                 std::move(geometry), std::move(nvertices));
}

bool Parcels::operator==(const Parcels& other) const
{
  if (size() != other.size())
    return false;
  if (name_ != other.name_ || nvertices_ != other.nvertices_)
    return false;
  if (!geometryEqual(geometry_, other.geometry_))
    return false;

  for (std::size_t i = 0; i < size(); ++i)
  {
    if (voxels_[i].size() != other.voxels_[i].size())
      return false;
    for (std::size_t j = 0; j < voxels_[i].size(); ++j)
      if (voxels_[i][j] != other.voxels_[i][j])
        return false;
  }

  // same structures, same vertex lists
  return vertices_ == other.vertices_;
}

}  // namespace axes
}  // namespace ciftiaxes
