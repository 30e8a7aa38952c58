#include "topoalign/sample_index.hpp"

#include "topoalign/errors.hpp"
#include "topoalign/grid_builder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace topoalign
{

SampleIndex::SampleIndex(const std::vector<Point3D> &samples)
    : samples_(samples)
{
    if (samples_.empty())
        throw EmptyInputError("nearest-sample index needs at least one sample");

    const PlaneBounds box = computeBoundingBox(samples_);
    gridCount_ = static_cast<std::size_t>(std::ceil(std::sqrt(double(samples_.size()))));
    if (gridCount_ == 0) gridCount_ = 1;

    double width  = box.maxNorthing - box.minNorthing;
    double height = box.maxEasting - box.minEasting;
    if (width  <= 0.0) width  = 1.0;
    if (height <= 0.0) height = 1.0;

    xMin_       = box.minNorthing;
    yMin_       = box.minEasting;
    cellWidth_  = width  / double(gridCount_);
    cellHeight_ = height / double(gridCount_);

    cells_.assign(gridCount_ * gridCount_, {});
    for (std::size_t i = 0; i < samples_.size(); i++)
    {
        auto ix = static_cast<std::size_t>(std::floor((samples_[i].x - xMin_) / cellWidth_));
        auto iy = static_cast<std::size_t>(std::floor((samples_[i].y - yMin_) / cellHeight_));
        if (ix >= gridCount_) ix = gridCount_ - 1;
        if (iy >= gridCount_) iy = gridCount_ - 1;
        cells_[ix * gridCount_ + iy].push_back(i);
    }
}

std::size_t SampleIndex::nearest(double x, double y) const
{
    const long G = static_cast<long>(gridCount_);
    auto cellOf = [G](double coord, double cmin, double spacing) {
        double r = std::floor((coord - cmin) / spacing);
        if (r < 0.0) return 0L;
        if (r >= double(G)) return G - 1;
        return static_cast<long>(r);
    };
    const long cx = cellOf(x, xMin_, cellWidth_);
    const long cy = cellOf(y, yMin_, cellHeight_);

    double bestD2 = std::numeric_limits<double>::infinity();
    std::size_t bestIdx = samples_.size();

    for (long r = 0;; r++)
    {
        const long x0 = cx - r, x1 = cx + r;
        const long y0 = cy - r, y1 = cy + r;

        for (long gx = std::max(x0, 0L); gx <= std::min(x1, G - 1); gx++)
        {
            for (long gy = std::max(y0, 0L); gy <= std::min(y1, G - 1); gy++)
            {
                if (std::max(std::labs(gx - cx), std::labs(gy - cy)) != r)
                    continue;

                for (std::size_t i : cells_[std::size_t(gx) * gridCount_ + std::size_t(gy)])
                {
                    const double dx = samples_[i].x - x;
                    const double dy = samples_[i].y - y;
                    const double d2 = dx * dx + dy * dy;
                    if (d2 < bestD2 || (d2 == bestD2 && i < bestIdx))
                    {
                        bestD2  = d2;
                        bestIdx = i;
                    }
                }
            }
        }

        // Closest any unscanned cell can be: distance to the scanned box's
        // sides that still have cells beyond them.
        double bound = std::numeric_limits<double>::infinity();
        bool more = false;
        if (x0 > 0)
        {
            more = true;
            bound = std::min(bound, x - (xMin_ + double(x0) * cellWidth_));
        }
        if (x1 < G - 1)
        {
            more = true;
            bound = std::min(bound, (xMin_ + double(x1 + 1) * cellWidth_) - x);
        }
        if (y0 > 0)
        {
            more = true;
            bound = std::min(bound, y - (yMin_ + double(y0) * cellHeight_));
        }
        if (y1 < G - 1)
        {
            more = true;
            bound = std::min(bound, (yMin_ + double(y1 + 1) * cellHeight_) - y);
        }

        if (!more) break;
        if (bestIdx < samples_.size() && bound > 0.0 && bestD2 < bound * bound) break;
    }
    return bestIdx;
}

} // namespace topoalign
