#ifndef CIFTIAXES_AXES_SCALAR_H_
#define CIFTIAXES_AXES_SCALAR_H_

#include <map>
#include <string>
#include <vector>

#include <ciftiaxes/axes/selector.h>
#include <ciftiaxes/axes/label.h>
#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace axes {

struct ScalarElement
{
  std::string name;
  Meta meta;
};

/// Each row/column is a named map with optional metadata.
class Scalar
{
public:
  /// `meta` defaults to one empty dictionary per name.
  explicit Scalar(std::vector<std::string> name, std::vector<Meta> meta = {});

  static Scalar fromMapping(const mapping::MatrixIndicesMap& mim);
  mapping::MatrixIndicesMap toMapping(int dim) const;

  std::size_t size() const
  {
    return name_.size();
  }
  const std::vector<std::string>& name() const
  {
    return name_;
  }
  const std::vector<Meta>& meta() const
  {
    return meta_;
  }

  ScalarElement element(std::ptrdiff_t index) const;
  Scalar slice(const ByRange& range) const;
  Scalar take(const std::vector<std::size_t>& positions) const;
  Scalar concat(const Scalar& other) const;

  /// Label axis sharing one lookup table between all rows/columns.
  Label toLabel(const LabelTable& table) const;
  /// Label axis with one lookup table per row/column, @throws ShapeMismatch.
  Label toLabel(const std::vector<LabelTable>& tables) const;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const
  {
    return !(*this == other);
  }

private:
  std::vector<std::string> name_;
  std::vector<Meta> meta_;
};

// Conversion between the axis metadata and the ordered <MetaData> pairs
mapping::MetaData toMetaData(const Meta& meta);
Meta fromMetaData(const mapping::MetaData& metadata);

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_SCALAR_H_
