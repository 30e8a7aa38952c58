/*****************************************************************************
 * triangulation.hpp
 * -----------------
 * Delaunay triangulation of scattered sample sites in the
 * northing/easting plane (Bowyer-Watson, incremental insertion).
 *
 * Sites sharing the same planar position are merged; the first sample in
 * input order wins. Fewer than three non-collinear sites give an empty
 * triangulation, which callers must accept.
 *****************************************************************************/
#ifndef TOPOALIGN_TRIANGULATION_HPP
#define TOPOALIGN_TRIANGULATION_HPP

#include "topoalign/point_set.hpp"

#include <array>
#include <vector>

namespace topoalign
{

/// Vertex indices into Triangulation::sites(), counter-clockwise.
struct Triangle
{
    int a, b, c;
};

class Triangulation
{
public:
    explicit Triangulation(const std::vector<Point3D> &samples);

    const std::vector<Point3D> &sites() const { return sites_; }
    const std::vector<Triangle> &triangles() const { return triangles_; }
    bool empty() const { return triangles_.empty(); }

    /**
     * \brief Locate the triangle containing (x, y).
     * \param bary Barycentric weights of (x, y) w.r.t. vertices a, b, c.
     * \return Triangle index, or -1 when the point lies outside.
     */
    int findTriangle(double x, double y, std::array<double, 3> &bary) const;

    /// Sorted, unique neighbour list of every site along triangle edges.
    std::vector<std::vector<int>> vertexNeighbors() const;

private:
    void triangulate();
    void buildLocator();

    std::vector<Point3D> sites_;
    std::vector<Triangle> triangles_;

    // Triangle bins over the site bounding box, for point location.
    double binXMin_ = 0.0, binYMin_ = 0.0;
    double binWidth_ = 1.0, binHeight_ = 1.0;
    std::size_t binCount_ = 0;
    std::vector<std::vector<int>> bins_;
};

} // namespace topoalign

#endif // TOPOALIGN_TRIANGULATION_HPP
