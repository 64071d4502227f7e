#include <ciftiaxes/xml/matrix_parser.h>
#include <ciftiaxes/xml/utils.h>

#include <iostream>
#include <stdexcept>

namespace ciftiaxes {
namespace xml {

namespace {

std::string lineOf(const tinyxml2::XMLElement* elem)
{
  return std::to_string(elem->GetLineNum());
}

}  // namespace

mapping::MetaData parseMetaData(const tinyxml2::XMLElement* metadata_elem)
{
  mapping::MetaData metadata;
  for (const tinyxml2::XMLElement* md = metadata_elem->FirstChildElement("MD"); md;
       md = md->NextSiblingElement("MD"))
  {
    metadata.emplace_back(childTextRequired(md, "Name"), childTextRequired(md, "Value"));
  }
  return metadata;
}

mapping::NamedMap parseNamedMap(const tinyxml2::XMLElement* named_map_elem)
{
  mapping::NamedMap nm;
  nm.map_name = childTextRequired(named_map_elem, "MapName");

  if (const auto* metadata_elem = named_map_elem->FirstChildElement("MetaData"))
    nm.metadata = parseMetaData(metadata_elem);

  if (const auto* table_elem = named_map_elem->FirstChildElement("LabelTable"))
  {
    nm.label_table.emplace();
    for (const tinyxml2::XMLElement* label = table_elem->FirstChildElement("Label"); label;
         label = label->NextSiblingElement("Label"))
    {
      mapping::LabelTableEntry entry;
      entry.key = int64AttributeRequired(label, "Key");
      entry.red = doubleAttributeRequired(label, "Red");
      entry.green = doubleAttributeRequired(label, "Green");
      entry.blue = doubleAttributeRequired(label, "Blue");
      entry.alpha = doubleAttributeRequired(label, "Alpha");
      entry.label = label->GetText() ? label->GetText() : "";
      nm.label_table->push_back(std::move(entry));
    }
  }
  return nm;
}

std::vector<Eigen::Vector3i> parseVoxelIndices(const tinyxml2::XMLElement* voxels_elem)
{
  const std::vector<int> flat = parseIntList(voxels_elem->GetText(), voxels_elem);
  if (flat.size() % 3 != 0)
    throw std::runtime_error("<VoxelIndicesIJK> must contain triplets of indices at line " + lineOf(voxels_elem));

  std::vector<Eigen::Vector3i> voxels;
  voxels.reserve(flat.size() / 3);
  for (std::size_t i = 0; i < flat.size(); i += 3)
    voxels.emplace_back(flat[i], flat[i + 1], flat[i + 2]);
  return voxels;
}

mapping::BrainModelEntry parseBrainModel(const tinyxml2::XMLElement* brain_model_elem)
{
  mapping::BrainModelEntry bm;
  bm.index_offset = int64AttributeRequired(brain_model_elem, "IndexOffset");
  bm.index_count = int64AttributeRequired(brain_model_elem, "IndexCount");
  bm.brain_structure = textAttributeRequired(brain_model_elem, "BrainStructure");
  try
  {
    bm.model_type = mapping::modelTypeFromString(textAttributeRequired(brain_model_elem, "ModelType"));
  }
  catch (const std::invalid_argument& e)
  {
    throw std::runtime_error(std::string(e.what()) + " at line " + lineOf(brain_model_elem));
  }
  bm.surface_number_of_vertices = intAttribute(brain_model_elem, "SurfaceNumberOfVertices");

  if (const auto* vertices_elem = brain_model_elem->FirstChildElement("VertexIndices"))
    bm.vertex_indices = parseIntList(vertices_elem->GetText(), vertices_elem);
  if (const auto* voxels_elem = brain_model_elem->FirstChildElement("VoxelIndicesIJK"))
    bm.voxel_indices_ijk = parseVoxelIndices(voxels_elem);
  return bm;
}

mapping::Surface parseSurface(const tinyxml2::XMLElement* surface_elem)
{
  mapping::Surface surface;
  surface.brain_structure = textAttributeRequired(surface_elem, "BrainStructure");
  surface.surface_number_of_vertices = intAttributeRequired(surface_elem, "SurfaceNumberOfVertices");
  return surface;
}

mapping::Parcel parseParcel(const tinyxml2::XMLElement* parcel_elem)
{
  mapping::Parcel parcel;
  parcel.name = textAttributeRequired(parcel_elem, "Name");

  if (const auto* voxels_elem = parcel_elem->FirstChildElement("VoxelIndicesIJK"))
    parcel.voxel_indices_ijk = parseVoxelIndices(voxels_elem);

  for (const tinyxml2::XMLElement* vertices_elem = parcel_elem->FirstChildElement("Vertices"); vertices_elem;
       vertices_elem = vertices_elem->NextSiblingElement("Vertices"))
  {
    mapping::ParcelVertices pv;
    pv.brain_structure = textAttributeRequired(vertices_elem, "BrainStructure");
    pv.indices = parseIntList(vertices_elem->GetText(), vertices_elem);
    parcel.vertices.push_back(std::move(pv));
  }
  return parcel;
}

mapping::Volume parseVolume(const tinyxml2::XMLElement* volume_elem)
{
  mapping::Volume volume;

  const std::string dims_str = textAttributeRequired(volume_elem, "VolumeDimensions");
  const std::vector<int> dims = parseIntList(dims_str.c_str(), volume_elem);
  if (dims.size() != 3)
    throw std::runtime_error("VolumeDimensions must have 3 values at line " + lineOf(volume_elem));
  volume.volume_dimensions = Eigen::Vector3i(dims[0], dims[1], dims[2]);

  const auto* transform_elem = volume_elem->FirstChildElement("TransformationMatrixVoxelIndicesIJKtoXYZ");
  if (!transform_elem)
    throw std::runtime_error("<Volume> missing required <TransformationMatrixVoxelIndicesIJKtoXYZ> at line " +
                             lineOf(volume_elem));

  volume.meter_exponent = intAttributeRequired(transform_elem, "MeterExponent");
  const std::vector<double> values = parseDoubleList(transform_elem->GetText(), transform_elem);
  if (values.size() != 16)
    throw std::runtime_error("TransformationMatrixVoxelIndicesIJKtoXYZ must have 16 values at line " +
                             lineOf(transform_elem));

  // row-major on disk
  for (int r = 0; r < 4; ++r)
    for (int c = 0; c < 4; ++c)
      volume.transform(r, c) = values[static_cast<std::size_t>(4 * r + c)];
  return volume;
}

mapping::MatrixIndicesMap parseMatrixIndicesMap(const tinyxml2::XMLElement* mim_elem)
{
  mapping::MatrixIndicesMap mim;

  const std::string dims = textAttributeRequired(mim_elem, "AppliesToMatrixDimension");
  mim.applies_to_matrix_dimension = parseIntList(dims.c_str(), mim_elem);
  if (mim.applies_to_matrix_dimension.empty())
    throw std::runtime_error("Empty AppliesToMatrixDimension at line " + lineOf(mim_elem));

  try
  {
    mim.indices_map_to_data_type = mapping::indexTypeFromString(textAttributeRequired(mim_elem, "IndicesMapToDataType"));
  }
  catch (const std::invalid_argument& e)
  {
    throw std::runtime_error(std::string(e.what()) + " at line " + lineOf(mim_elem));
  }

  mim.number_of_series_points = int64Attribute(mim_elem, "NumberOfSeriesPoints");
  mim.series_exponent = intAttribute(mim_elem, "SeriesExponent");
  mim.series_start = doubleAttribute(mim_elem, "SeriesStart");
  mim.series_step = doubleAttribute(mim_elem, "SeriesStep");
  mim.series_unit = textAttribute(mim_elem, "SeriesUnit");

  for (const tinyxml2::XMLElement* child = mim_elem->FirstChildElement(); child; child = child->NextSiblingElement())
  {
    const std::string tag = child->Name();
    if (tag == "NamedMap")
      mim.named_maps.push_back(parseNamedMap(child));
    else if (tag == "BrainModel")
      mim.brain_models.push_back(parseBrainModel(child));
    else if (tag == "Surface")
      mim.surfaces.push_back(parseSurface(child));
    else if (tag == "Parcel")
      mim.parcels.push_back(parseParcel(child));
    else if (tag == "Volume")
    {
      if (mim.volume)
        throw std::runtime_error("Duplicate <Volume> at line " + lineOf(child));
      mim.volume = parseVolume(child);
    }
    else
      throw std::runtime_error("Unexpected <" + tag + "> in <MatrixIndicesMap> at line " + lineOf(child));
  }
  return mim;
}

mapping::Matrix parseMatrix(const tinyxml2::XMLElement* matrix_elem)
{
  if (!matrix_elem)
    throw std::runtime_error("parseMatrix: null <Matrix> element");

  mapping::Matrix matrix;
  if (const auto* metadata_elem = matrix_elem->FirstChildElement("MetaData"))
    matrix.metadata = parseMetaData(metadata_elem);

  for (const tinyxml2::XMLElement* mim_elem = matrix_elem->FirstChildElement("MatrixIndicesMap"); mim_elem;
       mim_elem = mim_elem->NextSiblingElement("MatrixIndicesMap"))
  {
    auto mim = std::make_shared<mapping::MatrixIndicesMap>(parseMatrixIndicesMap(mim_elem));
    for (int dim : mim->applies_to_matrix_dimension)
      if (matrix.getIndexMap(dim))
        throw std::runtime_error("Matrix dimension " + std::to_string(dim) +
                                 " is described by several MatrixIndicesMap elements (line " + lineOf(mim_elem) +
                                 ")");
    matrix.maps.push_back(std::move(mim));
  }
  return matrix;
}

bool loadMatrixFromText(const std::string& text, mapping::Matrix& matrix)
{
  tinyxml2::XMLDocument doc;
  if (doc.Parse(text.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "Error parsing CIFTI XML text: " << doc.ErrorStr() << std::endl;
    return false;
  }

  const tinyxml2::XMLElement* matrix_elem = doc.FirstChildElement("Matrix");
  if (const auto* root = doc.FirstChildElement("CIFTI"))
    matrix_elem = root->FirstChildElement("Matrix");
  if (!matrix_elem)
  {
    std::cerr << "Error parsing CIFTI XML text: no <Matrix> element" << std::endl;
    return false;
  }

  matrix = parseMatrix(matrix_elem);
  return true;
}

}  // namespace xml
}  // namespace ciftiaxes
