#include "topoalign/grid_builder.hpp"

#include "topoalign/errors.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace topoalign
{

bool TerrainGrid::hasUndefinedCells() const
{
    return z.hasNaN();
}

/*****************************************************************************
 * computeBoundingBox
 ****************************************************************************/
PlaneBounds computeBoundingBox(const std::vector<Point3D> &points)
{
    double xMin = std::numeric_limits<double>::max();
    double xMax = -std::numeric_limits<double>::max();
    double yMin = std::numeric_limits<double>::max();
    double yMax = -std::numeric_limits<double>::max();

#ifdef _OPENMP
#pragma omp parallel
    {
        double locXmin = std::numeric_limits<double>::max();
        double locXmax = -std::numeric_limits<double>::max();
        double locYmin = std::numeric_limits<double>::max();
        double locYmax = -std::numeric_limits<double>::max();

#pragma omp for nowait
        for (std::size_t i = 0; i < points.size(); i++)
        {
            const auto &p = points[i];
            if (p.x < locXmin) locXmin = p.x;
            if (p.x > locXmax) locXmax = p.x;
            if (p.y < locYmin) locYmin = p.y;
            if (p.y > locYmax) locYmax = p.y;
        }
#pragma omp critical
        {
            if (locXmin < xMin) xMin = locXmin;
            if (locXmax > xMax) xMax = locXmax;
            if (locYmin < yMin) yMin = locYmin;
            if (locYmax > yMax) yMax = locYmax;
        }
    }
#else
    for (const auto &p : points)
    {
        if (p.x < xMin) xMin = p.x;
        if (p.x > xMax) xMax = p.x;
        if (p.y < yMin) yMin = p.y;
        if (p.y > yMax) yMax = p.y;
    }
#endif

    return {xMin, xMax, yMin, yMax};
}

/*****************************************************************************
 * buildGrid
 ****************************************************************************/
static double axisCoordinate(double lo, double hi, Eigen::Index i, Eigen::Index n)
{
    if (n < 2) return lo;
    if (i == n - 1) return hi;
    return lo + (hi - lo) * double(i) / double(n - 1);
}

TerrainGrid buildGrid(const std::vector<Point3D> &samples, int resolution)
{
    if (samples.empty())
        throw EmptyInputError("cannot build a grid without terrain samples");
    if (resolution < 1)
        throw InvalidParameterError("grid resolution must be positive, got " +
                                    std::to_string(resolution));

    TerrainGrid grid;
    grid.bounds     = computeBoundingBox(samples);
    grid.resolution = resolution;

    const Eigen::Index R = resolution;
    grid.x.resize(R, R);
    grid.y.resize(R, R);
    grid.z.setConstant(R, R, std::numeric_limits<double>::quiet_NaN());

    for (Eigen::Index i = 0; i < R; i++)
    {
        const double gx = axisCoordinate(grid.bounds.minNorthing, grid.bounds.maxNorthing, i, R);
        for (Eigen::Index j = 0; j < R; j++)
        {
            grid.x(i, j) = gx;
            grid.y(i, j) = axisCoordinate(grid.bounds.minEasting, grid.bounds.maxEasting, j, R);
        }
    }
    return grid;
}

} // namespace topoalign
