#include "topoalign/terrain_cache.hpp"

#include <utility>

namespace topoalign
{

static bool sameStation(const SurveyPoint &p, const SurveyPoint &q)
{
    return p.northing == q.northing && p.easting == q.easting && p.elevation == q.elevation &&
           p.source == q.source && p.station == q.station && p.description == q.description;
}

std::shared_ptr<const TerrainSurface> TerrainCache::surface(const PointSet &points, int resolution)
{
    const std::size_t key = points.fingerprint();
    std::vector<Point3D> samples = points.terrainSamples();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto range = surfaces_.equal_range(key);
        for (auto it = range.first; it != range.second; ++it)
        {
            if (it->second.resolution == resolution && it->second.samples == samples)
            {
                hits_++;
                return it->second.surface;
            }
        }
        misses_++;
    }

    // Built outside the lock; a concurrent miss on the same key produces an
    // identical surface, so whichever is stored first wins.
    auto built = std::make_shared<const TerrainSurface>(buildTerrainSurface(samples, resolution));

    std::lock_guard<std::mutex> lock(mutex_);
    auto range = surfaces_.equal_range(key);
    for (auto it = range.first; it != range.second; ++it)
    {
        if (it->second.resolution == resolution && it->second.samples == samples)
            return it->second.surface;
    }
    surfaces_.emplace(key, SurfaceEntry{std::move(samples), resolution, built});
    return built;
}

std::shared_ptr<const Alignment> TerrainCache::alignment(const StationPair &stations,
                                                         double sag, std::size_t sampleCount)
{
    auto matches = [&](const AlignmentEntry &e) {
        return e.sag == sag && e.sampleCount == sampleCount &&
               sameStation(e.stations.a, stations.a) && sameStation(e.stations.b, stations.b);
    };

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &e : alignments_)
        {
            if (matches(e))
            {
                hits_++;
                return e.alignment;
            }
        }
        misses_++;
    }

    auto built = std::make_shared<const Alignment>(computeAlignment(stations, sag, sampleCount));

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &e : alignments_)
    {
        if (matches(e)) return e.alignment;
    }
    alignments_.push_back({stations, sag, sampleCount, built});
    return built;
}

void TerrainCache::invalidate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    surfaces_.clear();
    alignments_.clear();
}

std::size_t TerrainCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return surfaces_.size() + alignments_.size();
}

std::size_t TerrainCache::hits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t TerrainCache::misses() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace topoalign
