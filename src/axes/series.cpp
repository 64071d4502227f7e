#include <ciftiaxes/axes/series.h>
#include <ciftiaxes/errors.h>

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace ciftiaxes {
namespace axes {

std::string seriesUnitToString(SeriesUnit unit)
{
  switch (unit)
  {
    case SeriesUnit::Second:
      return "SECOND";
    case SeriesUnit::Hertz:
      return "HERTZ";
    case SeriesUnit::Meter:
      return "METER";
    case SeriesUnit::Radian:
      return "RADIAN";
  }
  throw std::invalid_argument("Unknown SeriesUnit");
}

SeriesUnit seriesUnitFromString(const std::string& str)
{
  std::string s(str);
  for (auto& c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  if (s == "SECOND")
    return SeriesUnit::Second;
  if (s == "HERTZ")
    return SeriesUnit::Hertz;
  if (s == "METER")
    return SeriesUnit::Meter;
  if (s == "RADIAN")
    return SeriesUnit::Radian;
  throw std::invalid_argument("Series unit should be one of second, hertz, meter or radian, not '" + str + "'");
}

Series::Series(double start, double step, std::size_t size, SeriesUnit unit)
  : start_(start), step_(step), size_(size), unit_(unit)
{
}

Series Series::fromMapping(const mapping::MatrixIndicesMap& mim)
{
  if (!mim.number_of_series_points || !mim.series_start || !mim.series_step || !mim.series_unit)
    throw std::runtime_error("Series MatrixIndicesMap is missing one of NumberOfSeriesPoints, SeriesStart, "
                             "SeriesStep or SeriesUnit");
  if (*mim.number_of_series_points < 0)
    throw ShapeMismatch("NumberOfSeriesPoints cannot be negative");

  const int exponent = mim.series_exponent.value_or(0);
  const double scale = std::pow(10.0, exponent);
  return Series(*mim.series_start * scale, *mim.series_step * scale,
                static_cast<std::size_t>(*mim.number_of_series_points), seriesUnitFromString(*mim.series_unit));
}

mapping::MatrixIndicesMap Series::toMapping(int dim) const
{
  mapping::MatrixIndicesMap mim;
  mim.applies_to_matrix_dimension = { dim };
  mim.indices_map_to_data_type = mapping::IndexType::Series;
  mim.series_exponent = 0;
  mim.series_start = start_;
  mim.series_step = step_;
  mim.number_of_series_points = static_cast<std::int64_t>(size_);
  mim.series_unit = seriesUnitToString(unit_);
  return mim;
}

Eigen::VectorXd Series::values() const
{
  Eigen::VectorXd out(static_cast<Eigen::Index>(size_));
  for (Eigen::Index i = 0; i < out.size(); ++i)
    out[i] = start_ + step_ * static_cast<double>(i);
  return out;
}

double Series::element(std::ptrdiff_t index) const
{
  const std::size_t pos = resolveIndex(index, size_);
  return start_ + step_ * static_cast<double>(pos);
}

Series Series::slice(const ByRange& range) const
{
  const SliceIndices idx = resolveSlice(range, size_);
  return Series(start_ + static_cast<double>(idx.start) * step_, step_ * static_cast<double>(idx.step), idx.count,
                unit_);
}

Series Series::concat(const Series& other) const
{
  if (other.step_ != step_)
    throw IncompatibleAxes("Can only concatenate Series with the same step size (" + std::to_string(step_) + " vs " +
                           std::to_string(other.step_) + ")");
  if (other.unit_ != unit_)
    throw IncompatibleAxes("Can only concatenate Series with the same unit (" + seriesUnitToString(unit_) + " vs " +
                           seriesUnitToString(other.unit_) + ")");
  return Series(start_, step_, size_ + other.size_, unit_);
}

bool Series::operator==(const Series& other) const
{
  return start_ == other.start_ && step_ == other.step_ && size_ == other.size_ && unit_ == other.unit_;
}

}  // namespace axes
}  // namespace ciftiaxes
