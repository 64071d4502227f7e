#include <ciftiaxes/xml/matrix_writer.h>
#include <ciftiaxes/xml/utils.h>

#include <sstream>

namespace ciftiaxes {
namespace xml {

namespace {

void writeMetaData(const mapping::MetaData& metadata, tinyxml2::XMLElement* parent)
{
  if (metadata.empty())
    return;

  auto* metadata_elem = parent->InsertNewChildElement("MetaData");
  for (const auto& kv : metadata)
  {
    auto* md = metadata_elem->InsertNewChildElement("MD");
    md->InsertNewChildElement("Name")->SetText(kv.first.c_str());
    md->InsertNewChildElement("Value")->SetText(kv.second.c_str());
  }
}

void writeVoxelIndices(const std::vector<Eigen::Vector3i>& voxels, tinyxml2::XMLElement* parent)
{
  std::ostringstream oss;
  for (std::size_t i = 0; i < voxels.size(); ++i)
  {
    if (i > 0)
      oss << '\n';
    oss << voxels[i].x() << ' ' << voxels[i].y() << ' ' << voxels[i].z();
  }
  parent->InsertNewChildElement("VoxelIndicesIJK")->SetText(oss.str().c_str());
}

void writeNamedMap(const mapping::NamedMap& nm, tinyxml2::XMLElement* parent)
{
  auto* nm_elem = parent->InsertNewChildElement("NamedMap");
  writeMetaData(nm.metadata, nm_elem);

  if (nm.label_table)
  {
    auto* table_elem = nm_elem->InsertNewChildElement("LabelTable");
    for (const auto& entry : *nm.label_table)
    {
      auto* label = table_elem->InsertNewChildElement("Label");
      label->SetAttribute("Key", entry.key);
      label->SetAttribute("Red", formatDouble(entry.red).c_str());
      label->SetAttribute("Green", formatDouble(entry.green).c_str());
      label->SetAttribute("Blue", formatDouble(entry.blue).c_str());
      label->SetAttribute("Alpha", formatDouble(entry.alpha).c_str());
      label->SetText(entry.label.c_str());
    }
  }

  nm_elem->InsertNewChildElement("MapName")->SetText(nm.map_name.c_str());
}

void writeBrainModel(const mapping::BrainModelEntry& bm, tinyxml2::XMLElement* parent)
{
  auto* bm_elem = parent->InsertNewChildElement("BrainModel");
  bm_elem->SetAttribute("IndexOffset", bm.index_offset);
  bm_elem->SetAttribute("IndexCount", bm.index_count);
  bm_elem->SetAttribute("ModelType", mapping::modelTypeToString(bm.model_type).c_str());
  bm_elem->SetAttribute("BrainStructure", bm.brain_structure.c_str());
  if (bm.surface_number_of_vertices)
    bm_elem->SetAttribute("SurfaceNumberOfVertices", *bm.surface_number_of_vertices);

  if (bm.model_type == mapping::ModelType::Surface)
    bm_elem->InsertNewChildElement("VertexIndices")->SetText(formatIntList(bm.vertex_indices).c_str());
  else
    writeVoxelIndices(bm.voxel_indices_ijk, bm_elem);
}

void writeParcel(const mapping::Parcel& parcel, tinyxml2::XMLElement* parent)
{
  auto* parcel_elem = parent->InsertNewChildElement("Parcel");
  parcel_elem->SetAttribute("Name", parcel.name.c_str());

  if (!parcel.voxel_indices_ijk.empty())
    writeVoxelIndices(parcel.voxel_indices_ijk, parcel_elem);

  for (const auto& pv : parcel.vertices)
  {
    auto* vertices_elem = parcel_elem->InsertNewChildElement("Vertices");
    vertices_elem->SetAttribute("BrainStructure", pv.brain_structure.c_str());
    vertices_elem->SetText(formatIntList(pv.indices).c_str());
  }
}

void writeVolume(const mapping::Volume& volume, tinyxml2::XMLElement* parent)
{
  auto* volume_elem = parent->InsertNewChildElement("Volume");
  const std::vector<int> dims{ volume.volume_dimensions.x(), volume.volume_dimensions.y(),
                               volume.volume_dimensions.z() };
  volume_elem->SetAttribute("VolumeDimensions", formatIntList(dims, ",").c_str());

  auto* transform_elem = volume_elem->InsertNewChildElement("TransformationMatrixVoxelIndicesIJKtoXYZ");
  transform_elem->SetAttribute("MeterExponent", volume.meter_exponent);

  std::ostringstream oss;
  for (int r = 0; r < 4; ++r)
  {
    if (r > 0)
      oss << '\n';
    for (int c = 0; c < 4; ++c)
    {
      if (c > 0)
        oss << ' ';
      oss << formatDouble(volume.transform(r, c));
    }
  }
  transform_elem->SetText(oss.str().c_str());
}

void writeMatrixIndicesMap(const mapping::MatrixIndicesMap& mim, tinyxml2::XMLElement* parent)
{
  auto* mim_elem = parent->InsertNewChildElement("MatrixIndicesMap");
  mim_elem->SetAttribute("AppliesToMatrixDimension", formatIntList(mim.applies_to_matrix_dimension, ",").c_str());
  mim_elem->SetAttribute("IndicesMapToDataType", mapping::indexTypeToString(mim.indices_map_to_data_type).c_str());

  if (mim.number_of_series_points)
    mim_elem->SetAttribute("NumberOfSeriesPoints", *mim.number_of_series_points);
  if (mim.series_exponent)
    mim_elem->SetAttribute("SeriesExponent", *mim.series_exponent);
  if (mim.series_start)
    mim_elem->SetAttribute("SeriesStart", formatDouble(*mim.series_start).c_str());
  if (mim.series_step)
    mim_elem->SetAttribute("SeriesStep", formatDouble(*mim.series_step).c_str());
  if (mim.series_unit)
    mim_elem->SetAttribute("SeriesUnit", mim.series_unit->c_str());

  for (const auto& nm : mim.named_maps)
    writeNamedMap(nm, mim_elem);

  // Surfaces and the Volume precede the entries referencing them
  for (const auto& surface : mim.surfaces)
  {
    auto* surface_elem = mim_elem->InsertNewChildElement("Surface");
    surface_elem->SetAttribute("BrainStructure", surface.brain_structure.c_str());
    surface_elem->SetAttribute("SurfaceNumberOfVertices", surface.surface_number_of_vertices);
  }
  if (mim.volume)
    writeVolume(*mim.volume, mim_elem);

  for (const auto& parcel : mim.parcels)
    writeParcel(parcel, mim_elem);
  for (const auto& bm : mim.brain_models)
    writeBrainModel(bm, mim_elem);
}

}  // namespace

tinyxml2::XMLElement* writeMatrix(const mapping::Matrix& matrix, tinyxml2::XMLDocument& doc,
                                  tinyxml2::XMLNode* parent)
{
  tinyxml2::XMLElement* matrix_elem = doc.NewElement("Matrix");
  parent->InsertEndChild(matrix_elem);

  writeMetaData(matrix.metadata, matrix_elem);
  for (const auto& mim : matrix.maps)
    writeMatrixIndicesMap(*mim, matrix_elem);
  return matrix_elem;
}

std::string saveMatrixToText(const mapping::Matrix& matrix)
{
  tinyxml2::XMLDocument doc;
  doc.InsertEndChild(doc.NewDeclaration());

  tinyxml2::XMLElement* root = doc.NewElement("CIFTI");
  root->SetAttribute("Version", "2");
  doc.InsertEndChild(root);
  writeMatrix(matrix, doc, root);

  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return printer.CStr();
}

}  // namespace xml
}  // namespace ciftiaxes
