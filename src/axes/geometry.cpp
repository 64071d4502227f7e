#include <ciftiaxes/axes/geometry.h>
#include <ciftiaxes/errors.h>

namespace ciftiaxes {
namespace axes {

bool geometryEqual(const VolumeGeometry& a, const VolumeGeometry& b)
{
  if (a.affine.has_value() != b.affine.has_value())
    return false;
  if (a.volume_shape.has_value() != b.volume_shape.has_value())
    return false;
  if (a.affine && (*a.affine - *b.affine).cwiseAbs().maxCoeff() >= kAffineTolerance)
    return false;
  if (a.volume_shape && *a.volume_shape != *b.volume_shape)
    return false;
  return true;
}

VolumeGeometry mergeGeometry(const VolumeGeometry& a, const VolumeGeometry& b, const std::string& what)
{
  if (a.empty())
    return b;
  if (b.empty())
    return a;

  if (*a.affine != *b.affine || *a.volume_shape != *b.volume_shape)
    throw IncompatibleGeometry("Trying to concatenate two " + what + " defined in a different brain volume");
  return a;
}

VertexCounts mergeVertexCounts(const VertexCounts& a, const VertexCounts& b, const std::string& what)
{
  VertexCounts out = a;
  for (const auto& [name, count] : b)
  {
    auto it = out.find(name);
    if (it != out.end() && it->second != count)
      throw InconsistentVertexCount("Trying to concatenate two " + what + " with inconsistent number of vertices for " +
                                    name + " (" + std::to_string(it->second) + " vs " + std::to_string(count) + ")");
    out[name] = count;
  }
  return out;
}

void requireGeometry(const VolumeGeometry& geometry, const std::string& what)
{
  if (!geometry.affine || !geometry.volume_shape)
    throw IncompatibleGeometry(what + " with volumetric elements requires both an affine and a volume shape");
  if ((geometry.volume_shape->array() <= 0).any())
    throw IncompatibleGeometry(what + " volume shape must be strictly positive");
}

mapping::Volume toVolume(const VolumeGeometry& geometry)
{
  mapping::Volume volume;
  volume.volume_dimensions = *geometry.volume_shape;
  volume.meter_exponent = kVolumeMeterExponent;
  volume.transform = *geometry.affine;
  return volume;
}

VolumeGeometry fromVolume(const std::optional<mapping::Volume>& volume)
{
  VolumeGeometry geometry;
  if (volume)
  {
    geometry.affine = volume->transform;
    geometry.volume_shape = volume->volume_dimensions;
  }
  return geometry;
}

}  // namespace axes
}  // namespace ciftiaxes
