/*****************************************************************************
 * errors.hpp
 * ----------
 * Exception types raised by the terrain and alignment engine.
 *
 *   TerrainError            base of everything below (std::runtime_error)
 *   EmptyInputError         no terrain samples to build a grid from
 *   InvalidStationsError    station set unusable for an alignment
 *   InvalidParameterError   numeric option out of range
 *****************************************************************************/
#ifndef TOPOALIGN_ERRORS_HPP
#define TOPOALIGN_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace topoalign
{

class TerrainError : public std::runtime_error
{
public:
    explicit TerrainError(const std::string &what) : std::runtime_error(what) {}
};

/// Raised by the grid/interpolation path; fatal to the terrain build.
class EmptyInputError : public TerrainError
{
public:
    explicit EmptyInputError(const std::string &what) : TerrainError(what) {}
};

/// Raised by the alignment path; callers absorb it and skip the alignment.
class InvalidStationsError : public TerrainError
{
public:
    explicit InvalidStationsError(const std::string &what) : TerrainError(what) {}
};

class InvalidParameterError : public TerrainError
{
public:
    explicit InvalidParameterError(const std::string &what) : TerrainError(what) {}
};

} // namespace topoalign

#endif // TOPOALIGN_ERRORS_HPP
