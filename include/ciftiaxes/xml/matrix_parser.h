#ifndef CIFTIAXES_XML_MATRIX_PARSER_H_
#define CIFTIAXES_XML_MATRIX_PARSER_H_

#include <string>
#include <vector>

#include <tinyxml2.h>

#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace xml {

mapping::MetaData parseMetaData(const tinyxml2::XMLElement* metadata_elem);
mapping::NamedMap parseNamedMap(const tinyxml2::XMLElement* named_map_elem);
mapping::BrainModelEntry parseBrainModel(const tinyxml2::XMLElement* brain_model_elem);
mapping::Surface parseSurface(const tinyxml2::XMLElement* surface_elem);
mapping::Parcel parseParcel(const tinyxml2::XMLElement* parcel_elem);
mapping::Volume parseVolume(const tinyxml2::XMLElement* volume_elem);
std::vector<Eigen::Vector3i> parseVoxelIndices(const tinyxml2::XMLElement* voxels_elem);

mapping::MatrixIndicesMap parseMatrixIndicesMap(const tinyxml2::XMLElement* mim_elem);

/// Parses a CIFTI-2 <Matrix> element, @throws std::runtime_error on invalid content.
mapping::Matrix parseMatrix(const tinyxml2::XMLElement* matrix_elem);

/**
 * @brief Parses CIFTI-2 header XML with either a <CIFTI> or a <Matrix> root.
 *
 * Returns false if the text is not well-formed XML or has no <Matrix>; invalid
 * content inside a well-formed document throws std::runtime_error.
 */
bool loadMatrixFromText(const std::string& text, mapping::Matrix& matrix);

}  // namespace xml
}  // namespace ciftiaxes

#endif  // CIFTIAXES_XML_MATRIX_PARSER_H_
