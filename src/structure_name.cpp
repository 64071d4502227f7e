#include <ciftiaxes/structure_name.h>
#include <ciftiaxes/errors.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace ciftiaxes {

namespace {

const std::array<const char*, 3> kOrientations = { "left", "right", "both" };

std::string toLower(std::string s)
{
  for (auto& c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string toUpper(std::string s)
{
  for (auto& c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

bool isOrientation(const std::string& s)
{
  const std::string lower = toLower(s);
  return std::find(kOrientations.begin(), kOrientations.end(), lower) != kOrientations.end();
}

bool isSeparator(char c)
{
  return c == '_' || c == ' ';
}

std::string buildStructureName(const std::string& input, const std::string& structure,
                               const std::string& orientation)
{
  std::string proposed = "CIFTI_STRUCTURE_" + toUpper(structure);
  if (toLower(orientation) != "both")
    proposed += "_" + toUpper(orientation);

  if (!isStructureName(proposed))
    throw InvalidStructureName("'" + input + "' was interpreted as " + proposed +
                               ", which is not a valid CIFTI brain structure");
  return proposed;
}

}  // namespace

const std::vector<std::string>& brainStructures()
{
  static const std::vector<std::string> structures = {
    "CIFTI_STRUCTURE_ACCUMBENS_LEFT",
    "CIFTI_STRUCTURE_ACCUMBENS_RIGHT",
    "CIFTI_STRUCTURE_ALL_WHITE_MATTER",
    "CIFTI_STRUCTURE_ALL_GREY_MATTER",
    "CIFTI_STRUCTURE_AMYGDALA_LEFT",
    "CIFTI_STRUCTURE_AMYGDALA_RIGHT",
    "CIFTI_STRUCTURE_BRAIN_STEM",
    "CIFTI_STRUCTURE_CAUDATE_LEFT",
    "CIFTI_STRUCTURE_CAUDATE_RIGHT",
    "CIFTI_STRUCTURE_CEREBELLAR_WHITE_MATTER_LEFT",
    "CIFTI_STRUCTURE_CEREBELLAR_WHITE_MATTER_RIGHT",
    "CIFTI_STRUCTURE_CEREBELLUM",
    "CIFTI_STRUCTURE_CEREBELLUM_LEFT",
    "CIFTI_STRUCTURE_CEREBELLUM_RIGHT",
    "CIFTI_STRUCTURE_CEREBRAL_WHITE_MATTER_LEFT",
    "CIFTI_STRUCTURE_CEREBRAL_WHITE_MATTER_RIGHT",
    "CIFTI_STRUCTURE_CORTEX",
    "CIFTI_STRUCTURE_CORTEX_LEFT",
    "CIFTI_STRUCTURE_CORTEX_RIGHT",
    "CIFTI_STRUCTURE_DIENCEPHALON_VENTRAL_LEFT",
    "CIFTI_STRUCTURE_DIENCEPHALON_VENTRAL_RIGHT",
    "CIFTI_STRUCTURE_HIPPOCAMPUS_LEFT",
    "CIFTI_STRUCTURE_HIPPOCAMPUS_RIGHT",
    "CIFTI_STRUCTURE_INVALID",
    "CIFTI_STRUCTURE_OTHER",
    "CIFTI_STRUCTURE_OTHER_GREY_MATTER",
    "CIFTI_STRUCTURE_OTHER_WHITE_MATTER",
    "CIFTI_STRUCTURE_PALLIDUM_LEFT",
    "CIFTI_STRUCTURE_PALLIDUM_RIGHT",
    "CIFTI_STRUCTURE_PUTAMEN_LEFT",
    "CIFTI_STRUCTURE_PUTAMEN_RIGHT",
    "CIFTI_STRUCTURE_THALAMUS_LEFT",
    "CIFTI_STRUCTURE_THALAMUS_RIGHT",
  };
  return structures;
}

bool isStructureName(const std::string& name)
{
  const auto& all = brainStructures();
  return std::find(all.begin(), all.end(), name) != all.end();
}

std::string toStructureName(const std::string& name)
{
  if (isStructureName(name))
    return name;

  const std::string lower = toLower(name);
  std::string structure = name;
  std::string orientation = "both";

  for (const std::string orient : kOrientations)
  {
    const std::size_t n = orient.size();
    if (lower.size() < n)
      continue;

    // hemisphere as prefix: "left_cortex", "LeftCortex"
    if (lower.compare(0, n, orient) == 0)
    {
      orientation = orient;
      structure = name.substr(n);
      if (!structure.empty() && isSeparator(structure.front()))
        structure.erase(0, 1);
      break;
    }

    // hemisphere as suffix: "cortex_left", "CortexLeft"
    if (lower.compare(lower.size() - n, n, orient) == 0)
    {
      orientation = orient;
      structure = name.substr(0, name.size() - n);
      if (!structure.empty() && isSeparator(structure.back()))
        structure.pop_back();
      break;
    }
  }

  return buildStructureName(name, structure, orientation);
}

std::string toStructureName(const std::string& structure, const std::string& orientation)
{
  const std::string input = structure + ", " + orientation;
  if (orientation.empty())
    return buildStructureName(input, structure, "both");

  if (isOrientation(structure))
    return buildStructureName(input, orientation, structure);
  return buildStructureName(input, structure, orientation);
}

}  // namespace ciftiaxes
