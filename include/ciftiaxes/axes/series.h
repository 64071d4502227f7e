#ifndef CIFTIAXES_AXES_SERIES_H_
#define CIFTIAXES_AXES_SERIES_H_

#include <cstddef>
#include <string>

#include <Eigen/Core>

#include <ciftiaxes/axes/selector.h>
#include <ciftiaxes/mapping/matrix_indices_map.h>

namespace ciftiaxes {
namespace axes {

enum class SeriesUnit
{
  Second,
  Hertz,
  Meter,
  Radian,
};

std::string seriesUnitToString(SeriesUnit unit);

/// Case-insensitive, @throws std::invalid_argument for anything else than second, hertz, meter or radian.
SeriesUnit seriesUnitFromString(const std::string& str);

/**
 * @brief Rows/columns sampled at regular intervals (time points, frequencies...).
 *
 * Element i is start + step * i. Nothing but the four parameters is stored, so
 * slices and concatenations stay exact arithmetic progressions.
 */
class Series
{
public:
  Series(double start, double step, std::size_t size, SeriesUnit unit = SeriesUnit::Second);

  static Series fromMapping(const mapping::MatrixIndicesMap& mim);
  mapping::MatrixIndicesMap toMapping(int dim) const;

  double start() const
  {
    return start_;
  }
  double step() const
  {
    return step_;
  }
  std::size_t size() const
  {
    return size_;
  }
  SeriesUnit unit() const
  {
    return unit_;
  }

  // All sample points
  Eigen::VectorXd values() const;

  double element(std::ptrdiff_t index) const;
  Series slice(const ByRange& range) const;

  /// Appends `other` after this series; the start of `other` is ignored.
  /// @throws IncompatibleAxes if step or unit differ.
  Series concat(const Series& other) const;

  bool operator==(const Series& other) const;
  bool operator!=(const Series& other) const
  {
    return !(*this == other);
  }

private:
  double start_;
  double step_;
  std::size_t size_;
  SeriesUnit unit_;
};

}  // namespace axes
}  // namespace ciftiaxes

#endif  // CIFTIAXES_AXES_SERIES_H_
