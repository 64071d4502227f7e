#ifndef CIFTIAXES_XML_MATRIX_WRITER_H_
#define CIFTIAXES_XML_MATRIX_WRITER_H_

#include <string>

#include <tinyxml2.h>

#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace xml {

/// Appends a <Matrix> element describing `matrix` to `parent` and returns it.
tinyxml2::XMLElement* writeMatrix(const mapping::Matrix& matrix, tinyxml2::XMLDocument& doc,
                                  tinyxml2::XMLNode* parent);

/// Serializes `matrix` as a complete <CIFTI Version="2"> document.
std::string saveMatrixToText(const mapping::Matrix& matrix);

}  // namespace xml
}  // namespace ciftiaxes

#endif  // CIFTIAXES_XML_MATRIX_WRITER_H_
