/*****************************************************************************
 * grid_builder.hpp
 * ----------------
 * Regular R x R sampling lattice over the bounding box of the terrain
 * samples. Rows run along northing, columns along easting.
 *****************************************************************************/
#ifndef TOPOALIGN_GRID_BUILDER_HPP
#define TOPOALIGN_GRID_BUILDER_HPP

#include "topoalign/point_set.hpp"

#include <Eigen/Dense>
#include <vector>

namespace topoalign
{

constexpr int kDefaultResolution = 50;

/**
 * \brief Grid node coordinates and elevations. z holds NaN for nodes that
 *        are still undefined; a finished surface has none.
 */
struct TerrainGrid
{
    Eigen::MatrixXd x;   ///< northing per node
    Eigen::MatrixXd y;   ///< easting per node
    Eigen::MatrixXd z;   ///< elevation per node
    PlaneBounds bounds{};
    int resolution = 0;

    bool hasUndefinedCells() const;
};

PlaneBounds computeBoundingBox(const std::vector<Point3D> &points);

/**
 * \brief Cartesian product grid spanning [min_n, max_n] x [min_e, max_e].
 *        A zero-width span is accepted: every node shares that coordinate.
 * \throws EmptyInputError if \p samples is empty.
 * \throws InvalidParameterError if \p resolution < 1.
 */
TerrainGrid buildGrid(const std::vector<Point3D> &samples,
                      int resolution = kDefaultResolution);

} // namespace topoalign

#endif // TOPOALIGN_GRID_BUILDER_HPP
