/*****************************************************************************
 * terrain_cache.hpp
 * -----------------
 * Memo table for derived results. Surfaces are keyed by the terrain
 * sample set and the grid resolution; alignments by the two stations, the
 * sag and the curve sample count. Entries are immutable and shared between
 * callers; invalidate() drops everything after the inputs change.
 *****************************************************************************/
#ifndef TOPOALIGN_TERRAIN_CACHE_HPP
#define TOPOALIGN_TERRAIN_CACHE_HPP

#include "topoalign/alignment_curve.hpp"
#include "topoalign/point_set.hpp"
#include "topoalign/surface_interpolator.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace topoalign
{

class TerrainCache
{
public:
    /// \throws EmptyInputError, InvalidParameterError as buildTerrainSurface.
    std::shared_ptr<const TerrainSurface> surface(const PointSet &points, int resolution);

    /// \throws InvalidStationsError, InvalidParameterError as computeAlignment.
    std::shared_ptr<const Alignment> alignment(const StationPair &stations,
                                               double sag, std::size_t sampleCount);

    void invalidate();

    std::size_t size() const;
    std::size_t hits() const;
    std::size_t misses() const;

private:
    struct SurfaceEntry
    {
        std::vector<Point3D> samples;
        int resolution;
        std::shared_ptr<const TerrainSurface> surface;
    };

    struct AlignmentEntry
    {
        StationPair stations;
        double sag;
        std::size_t sampleCount;
        std::shared_ptr<const Alignment> alignment;
    };

    std::unordered_multimap<std::size_t, SurfaceEntry> surfaces_;
    std::vector<AlignmentEntry> alignments_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace topoalign

#endif // TOPOALIGN_TERRAIN_CACHE_HPP
