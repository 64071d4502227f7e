#ifndef CIFTIAXES_STRUCTURE_NAME_H_
#define CIFTIAXES_STRUCTURE_NAME_H_

#include <string>
#include <vector>

namespace ciftiaxes {

/// All brain structure names recognized by CIFTI-2, e.g. "CIFTI_STRUCTURE_CORTEX_LEFT".
const std::vector<std::string>& brainStructures();

bool isStructureName(const std::string& name);

/**
 * @brief Converts the name of an anatomical region to the CIFTI-2 vocabulary.
 *
 * Names already in CIFTI format are returned unchanged. Names like
 * "left_cortex", "cortex_left", "LeftCortex" or "CortexLeft" become
 * "CIFTI_STRUCTURE_CORTEX_LEFT"; names without a hemisphere ("brain_stem")
 * map to the bilateral structure.
 *
 * @throws InvalidStructureName if the interpreted name is not a CIFTI structure.
 */
std::string toStructureName(const std::string& name);

/**
 * @brief Two-part form: a structure and a hemisphere (left, right or both).
 *
 * The parts may come in either order. An empty second part means "both".
 */
std::string toStructureName(const std::string& structure, const std::string& orientation);

}  // namespace ciftiaxes

#endif  // CIFTIAXES_STRUCTURE_NAME_H_
