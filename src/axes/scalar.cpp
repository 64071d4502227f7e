#include <ciftiaxes/axes/scalar.h>
#include <ciftiaxes/errors.h>

namespace ciftiaxes {
namespace axes {

mapping::MetaData toMetaData(const Meta& meta)
{
  return mapping::MetaData(meta.begin(), meta.end());
}

Meta fromMetaData(const mapping::MetaData& metadata)
{
  Meta meta;
  for (const auto& [key, value] : metadata)
    meta[key] = value;
  return meta;
}

Scalar::Scalar(std::vector<std::string> name, std::vector<Meta> meta) : name_(std::move(name)), meta_(std::move(meta))
{
  if (meta_.empty())
    meta_.resize(name_.size());

  if (meta_.size() != name_.size())
    throw ShapeMismatch("Input meta has incorrect size (" + std::to_string(meta_.size()) + ") for Scalar axis of size " +
                        std::to_string(name_.size()));
}

Scalar Scalar::fromMapping(const mapping::MatrixIndicesMap& mim)
{
  std::vector<std::string> names;
  std::vector<Meta> meta;
  names.reserve(mim.named_maps.size());
  meta.reserve(mim.named_maps.size());
  for (const auto& nm : mim.named_maps)
  {
    names.push_back(nm.map_name);
    meta.push_back(fromMetaData(nm.metadata));
  }
  return Scalar(std::move(names), std::move(meta));
}

mapping::MatrixIndicesMap Scalar::toMapping(int dim) const
{
  mapping::MatrixIndicesMap mim;
  mim.applies_to_matrix_dimension = { dim };
  mim.indices_map_to_data_type = mapping::IndexType::Scalars;
  for (std::size_t i = 0; i < size(); ++i)
  {
    mapping::NamedMap nm;
    nm.map_name = name_[i];
    nm.metadata = toMetaData(meta_[i]);
    mim.named_maps.push_back(std::move(nm));
  }
  return mim;
}

ScalarElement Scalar::element(std::ptrdiff_t index) const
{
  const std::size_t pos = resolveIndex(index, size());
  return { name_[pos], meta_[pos] };
}

Scalar Scalar::slice(const ByRange& range) const
{
  return take(resolveSlice(range, size()).positions());
}

Scalar Scalar::take(const std::vector<std::size_t>& positions) const
{
  return Scalar(gather(name_, positions), gather(meta_, positions));
}

Scalar Scalar::concat(const Scalar& other) const
{
  return Scalar(append(name_, other.name_), append(meta_, other.meta_));
}

Label Scalar::toLabel(const LabelTable& table) const
{
  return Label(name_, std::vector<LabelTable>(size(), table), meta_);
}

Label Scalar::toLabel(const std::vector<LabelTable>& tables) const
{
  if (tables.size() != size())
    throw ShapeMismatch("Got " + std::to_string(tables.size()) + " label tables for Scalar axis of size " +
                        std::to_string(size()));
  return Label(name_, tables, meta_);
}

bool Scalar::operator==(const Scalar& other) const
{
  return name_ == other.name_ && meta_ == other.meta_;
}

}  // namespace axes
}  // namespace ciftiaxes
