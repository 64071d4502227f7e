#ifndef CIFTIAXES_ERRORS_H_
#define CIFTIAXES_ERRORS_H_

#include <stdexcept>
#include <string>

namespace ciftiaxes {

/// Base class of every error raised while building, combining or indexing axes.
class AxisError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// Array lengths disagree at construction
class ShapeMismatch : public AxisError
{
public:
  using AxisError::AxisError;
};

// Surface element without vertex index or volume element without voxel index
class UndefinedIndices : public AxisError
{
public:
  using AxisError::AxisError;
};

class InvalidStructureName : public AxisError
{
public:
  using AxisError::AxisError;
};

class InvalidMaskRank : public AxisError
{
public:
  using AxisError::AxisError;
};

// Affine / volume shape conflict
class IncompatibleGeometry : public AxisError
{
public:
  using AxisError::AxisError;
};

class InconsistentVertexCount : public AxisError
{
public:
  using AxisError::AxisError;
};

class ParcelNotFound : public AxisError
{
public:
  using AxisError::AxisError;
};

class AmbiguousParcelName : public AxisError
{
public:
  using AxisError::AxisError;
};

class IndexOutOfRange : public AxisError
{
public:
  using AxisError::AxisError;
};

class UnsupportedIndex : public AxisError
{
public:
  using AxisError::AxisError;
};

// Series with different step or unit
class IncompatibleAxes : public AxisError
{
public:
  using AxisError::AxisError;
};

}  // namespace ciftiaxes

#endif  // CIFTIAXES_ERRORS_H_
