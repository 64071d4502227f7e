#include <ciftiaxes/axes/label.h>
#include <ciftiaxes/axes/scalar.h>
#include <ciftiaxes/errors.h>

namespace ciftiaxes {
namespace axes {

Label::Label(std::vector<std::string> name, std::vector<LabelTable> label, std::vector<Meta> meta)
  : name_(std::move(name)), label_(std::move(label)), meta_(std::move(meta))
{
  if (label_.size() != name_.size())
    throw ShapeMismatch("Input label has incorrect size (" + std::to_string(label_.size()) +
                        ") for Label axis of size " + std::to_string(name_.size()));
  if (meta_.size() != name_.size())
    throw ShapeMismatch("Input meta has incorrect size (" + std::to_string(meta_.size()) + ") for Label axis of size " +
                        std::to_string(name_.size()));
}

Label Label::fromMapping(const mapping::MatrixIndicesMap& mim)
{
  std::vector<LabelTable> tables;
  tables.reserve(mim.named_maps.size());
  for (const auto& nm : mim.named_maps)
  {
    LabelTable table;
    if (nm.label_table)
    {
      for (const auto& entry : *nm.label_table)
        table[entry.key] = { entry.label, Eigen::Vector4d(entry.red, entry.green, entry.blue, entry.alpha) };
    }
    tables.push_back(std::move(table));
  }
  return Scalar::fromMapping(mim).toLabel(tables);
}

mapping::MatrixIndicesMap Label::toMapping(int dim) const
{
  mapping::MatrixIndicesMap mim;
  mim.applies_to_matrix_dimension = { dim };
  mim.indices_map_to_data_type = mapping::IndexType::Labels;
  for (std::size_t i = 0; i < size(); ++i)
  {
    mapping::NamedMap nm;
    nm.map_name = name_[i];
    nm.metadata = toMetaData(meta_[i]);
    nm.label_table.emplace();
    for (const auto& [key, entry] : label_[i])
    {
      mapping::LabelTableEntry out;
      out.key = key;
      out.label = entry.name;
      out.red = entry.rgba[0];
      out.green = entry.rgba[1];
      out.blue = entry.rgba[2];
      out.alpha = entry.rgba[3];
      nm.label_table->push_back(std::move(out));
    }
    mim.named_maps.push_back(std::move(nm));
  }
  return mim;
}

LabelElement Label::element(std::ptrdiff_t index) const
{
  const std::size_t pos = resolveIndex(index, size());
  return { name_[pos], label_[pos], meta_[pos] };
}

Label Label::slice(const ByRange& range) const
{
  return take(resolveSlice(range, size()).positions());
}

Label Label::take(const std::vector<std::size_t>& positions) const
{
  return Label(gather(name_, positions), gather(label_, positions), gather(meta_, positions));
}

Label Label::concat(const Label& other) const
{
  return Label(append(name_, other.name_), append(label_, other.label_), append(meta_, other.meta_));
}

bool Label::operator==(const Label& other) const
{
  return name_ == other.name_ && meta_ == other.meta_ && label_ == other.label_;
}

}  // namespace axes
}  // namespace ciftiaxes
