/*****************************************************************************
 * surface_interpolator.hpp
 * ------------------------
 * Two-pass terrain reconstruction onto a TerrainGrid:
 *
 *   1) Smooth pass: Clough-Tocher cubic patches over the Delaunay
 *      triangulation of the samples. C1 inside the convex hull, exact at
 *      the sample sites, NaN outside every triangle.
 *   2) Fallback pass: every node left undefined takes the elevation of
 *      its nearest sample (ties -> first sample in input order).
 *
 * Vertex gradients for the patches come from a global estimate that
 * minimises the second derivative of the cubic edge curves (Gauss-Seidel
 * sweeps until the relative update falls below the tolerance).
 *****************************************************************************/
#ifndef TOPOALIGN_SURFACE_INTERPOLATOR_HPP
#define TOPOALIGN_SURFACE_INTERPOLATOR_HPP

#include "topoalign/grid_builder.hpp"
#include "topoalign/point_set.hpp"
#include "topoalign/triangulation.hpp"

#include <Eigen/Dense>
#include <Eigen/StdVector>
#include <cstddef>
#include <vector>

namespace topoalign
{

using GradientField = std::vector<Eigen::Vector2d, Eigen::aligned_allocator<Eigen::Vector2d>>;

constexpr int    kGradientMaxIterations = 400;
constexpr double kGradientTolerance     = 1e-6;

/**
 * \brief Cubic Bezier ordinates of one Clough-Tocher macro triangle.
 *        The triangle is split at its centroid into three sub-triangles;
 *        sub-triangle i is the one opposite vertex i.
 */
struct CloughTocherPatch
{
    double f[3];            ///< vertex values
    double edge[3][3];      ///< edge[i][j]: ordinate beside vertex i on edge i-j
    double toCenter[3];     ///< ordinate beside vertex i on the spoke to the centroid
    double inner[3];        ///< interior ordinate of sub-triangle i
    double nearCenter[3];   ///< ordinate beside the centroid on spoke i
    double center;          ///< value at the centroid
};

/**
 * \brief Estimate a gradient at every site of \p tri.
 *        Sites without neighbours keep a zero gradient.
 */
GradientField estimateGradients(const Triangulation &tri,
                                int maxIterations = kGradientMaxIterations,
                                double tolerance = kGradientTolerance);

class CloughTocherInterpolator
{
public:
    explicit CloughTocherInterpolator(const std::vector<Point3D> &samples);

    /// Elevation at (x, y); NaN outside the triangulated region.
    double operator()(double x, double y) const;

    const Triangulation &triangulation() const { return tri_; }
    const GradientField &gradients() const { return gradients_; }

private:
    Triangulation tri_;
    GradientField gradients_;
    std::vector<CloughTocherPatch> patches_;
};

struct InterpolationSummary
{
    std::size_t triangles   = 0;
    std::size_t smoothNodes = 0;   ///< nodes defined by the smooth pass
    std::size_t filledNodes = 0;   ///< nodes filled by the fallback pass
};

/// Pass 1. Writes z for every node; nodes outside the hull become NaN.
std::size_t interpolateSmooth(const std::vector<Point3D> &samples, TerrainGrid &grid);

/// Pass 2. Fills every NaN node from its nearest sample; returns the count.
std::size_t fillFromNearest(const std::vector<Point3D> &samples, TerrainGrid &grid);

/**
 * \brief Both passes. On return \p grid has no undefined cell.
 * \throws EmptyInputError if \p samples is empty.
 */
InterpolationSummary interpolateSurface(const std::vector<Point3D> &samples, TerrainGrid &grid);

struct TerrainSurface
{
    TerrainGrid grid;
    InterpolationSummary summary;
};

/**
 * \brief Grid construction followed by both interpolation passes.
 * \throws EmptyInputError, InvalidParameterError (see buildGrid).
 */
TerrainSurface buildTerrainSurface(const std::vector<Point3D> &samples,
                                   int resolution = kDefaultResolution);

} // namespace topoalign

#endif // TOPOALIGN_SURFACE_INTERPOLATOR_HPP
