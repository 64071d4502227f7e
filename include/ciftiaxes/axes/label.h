#ifndef CIFTIAXES_AXES_LABEL_H_
#define CIFTIAXES_AXES_LABEL_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <Eigen/Core>

#include <ciftiaxes/axes/selector.h>
#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace axes {

struct LabelEntry
{
  std::string name;
  Eigen::Vector4d rgba{ 0, 0, 0, 0 };  // red, green, blue, alpha in [0, 1]

  bool operator==(const LabelEntry& other) const
  {
    return name == other.name && rgba == other.rgba;
  }
  bool operator!=(const LabelEntry& other) const
  {
    return !(*this == other);
  }
};

/// Free-form metadata of one row/column.
using Meta = std::map<std::string, std::string>;

/// Lookup table from label value to label name and colour.
using LabelTable = std::map<std::int64_t, LabelEntry>;

struct LabelElement
{
  std::string name;
  LabelTable label;
  Meta meta;
};

/// Each row/column is a named label map with its own lookup table and metadata.
class Label
{
public:
  Label(std::vector<std::string> name, std::vector<LabelTable> label, std::vector<Meta> meta);

  static Label fromMapping(const mapping::MatrixIndicesMap& mim);
  mapping::MatrixIndicesMap toMapping(int dim) const;

  std::size_t size() const
  {
    return name_.size();
  }
  const std::vector<std::string>& name() const
  {
    return name_;
  }
  const std::vector<LabelTable>& label() const
  {
    return label_;
  }
  const std::vector<Meta>& meta() const
  {
    return meta_;
  }

  LabelElement element(std::ptrdiff_t index) const;
  Label slice(const ByRange& range) const;
  Label take(const std::vector<std::size_t>& positions) const;
  Label concat(const Label& other) const;

  bool operator==(const Label& other) const;
  bool operator!=(const Label& other) const
  {
    return !(*this == other);
  }

private:
  std::vector<std::string> name_;
  std::vector<LabelTable> label_;
  std::vector<Meta> meta_;
};

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_LABEL_H_
