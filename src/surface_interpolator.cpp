#include "topoalign/surface_interpolator.hpp"

#include "topoalign/errors.hpp"
#include "topoalign/sample_index.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace topoalign
{

/*****************************************************************************
 * 1) Vertex gradients
 ****************************************************************************/
GradientField estimateGradients(const Triangulation &tri, int maxIterations, double tolerance)
{
    const auto &sites = tri.sites();
    const auto neighbors = tri.vertexNeighbors();
    GradientField grad(sites.size(), Eigen::Vector2d::Zero());

    for (int iter = 0; iter < maxIterations; iter++)
    {
        double err = 0.0;
        for (std::size_t i = 0; i < sites.size(); i++)
        {
            if (neighbors[i].empty()) continue;

            Eigen::Matrix2d Q = Eigen::Matrix2d::Zero();
            Eigen::Vector2d s = Eigen::Vector2d::Zero();
            for (int jn : neighbors[i])
            {
                const auto j = std::size_t(jn);
                const Eigen::Vector2d e(sites[j].x - sites[i].x, sites[j].y - sites[i].y);
                const double L  = e.norm();
                const double L3 = L * L * L;

                // d/dg_i of the squared second derivative of the cubic
                // Hermite curve along edge i-j.
                Q += 4.0 * e * e.transpose() / L3;
                s += (6.0 * (sites[j].z - sites[i].z) - 2.0 * grad[j].dot(e)) * e / L3;
            }

            const double det = Q.determinant();
            if (std::fabs(det) <= 1e-14 * Q.squaredNorm()) continue;

            const Eigen::Vector2d r = Q.inverse() * s;
            const double change = (r - grad[i]).cwiseAbs().maxCoeff();
            grad[i] = r;
            err = std::max(err, change / std::max(1.0, r.cwiseAbs().maxCoeff()));
        }
        if (err < tolerance) break;
    }
    return grad;
}

/*****************************************************************************
 * 2) Clough-Tocher patches
 ****************************************************************************/
static CloughTocherPatch buildPatch(const std::array<Eigen::Vector2d, 3> &V,
                                    const std::array<double, 3> &f,
                                    const std::array<Eigen::Vector2d, 3> &g)
{
    CloughTocherPatch p{};
    const Eigen::Vector2d C = (V[0] + V[1] + V[2]) / 3.0;

    for (int i = 0; i < 3; i++)
    {
        p.f[i] = f[std::size_t(i)];
        for (int j = 0; j < 3; j++)
        {
            p.edge[i][j] = (i == j) ? f[std::size_t(i)]
                                    : f[std::size_t(i)] + g[std::size_t(i)].dot(V[std::size_t(j)] - V[std::size_t(i)]) / 3.0;
        }
        p.toCenter[i] = f[std::size_t(i)] + g[std::size_t(i)].dot(C - V[std::size_t(i)]) / 3.0;
    }

    // Interior ordinate of each sub-triangle: chosen so the derivative
    // normal to the outer edge is linear along it. It then depends only on
    // the two end vertices, which makes neighbouring patches join C1.
    for (int i = 0; i < 3; i++)
    {
        const int j = (i + 1) % 3;
        const int k = (i + 2) % 3;
        const Eigen::Vector2d t   = V[std::size_t(k)] - V[std::size_t(j)];
        const Eigen::Vector2d mid = 0.5 * (V[std::size_t(j)] + V[std::size_t(k)]);
        const double alpha = (C - mid).dot(t) / t.squaredNorm();

        const double d0 = p.toCenter[j] - 0.5 * (p.f[j] + p.edge[j][k]);
        const double d2 = p.toCenter[k] - 0.5 * (p.edge[k][j] + p.f[k]);
        p.inner[i] = 0.5 * (p.edge[j][k] + p.edge[k][j]) + 0.5 * (d0 + d2)
                   + alpha * (1.5 * (p.edge[k][j] - p.edge[j][k]) - 0.5 * (p.f[k] - p.f[j]));
    }

    // C1 across the three spokes.
    for (int m = 0; m < 3; m++)
        p.nearCenter[m] = (p.toCenter[m] + p.inner[(m + 1) % 3] + p.inner[(m + 2) % 3]) / 3.0;
    p.center = (p.nearCenter[0] + p.nearCenter[1] + p.nearCenter[2]) / 3.0;

    return p;
}

static double evaluatePatch(const CloughTocherPatch &p, const std::array<double, 3> &l)
{
    int i = 0;
    if (l[1] < l[std::size_t(i)]) i = 1;
    if (l[2] < l[std::size_t(i)]) i = 2;
    const int j = (i + 1) % 3;
    const int k = (i + 2) % 3;

    // Barycentrics inside sub-triangle (V_j, V_k, centroid).
    const double u = l[std::size_t(j)] - l[std::size_t(i)];
    const double v = l[std::size_t(k)] - l[std::size_t(i)];
    const double w = 3.0 * l[std::size_t(i)];

    const double u2 = u * u, v2 = v * v, w2 = w * w;
    return p.f[j] * u2 * u
         + p.f[k] * v2 * v
         + p.center * w2 * w
         + 3.0 * p.edge[j][k] * u2 * v
         + 3.0 * p.edge[k][j] * u * v2
         + 3.0 * p.toCenter[j] * u2 * w
         + 3.0 * p.toCenter[k] * v2 * w
         + 3.0 * p.nearCenter[j] * u * w2
         + 3.0 * p.nearCenter[k] * v * w2
         + 6.0 * p.inner[i] * u * v * w;
}

CloughTocherInterpolator::CloughTocherInterpolator(const std::vector<Point3D> &samples)
    : tri_(samples)
{
    if (tri_.empty()) return;

    gradients_ = estimateGradients(tri_);

    const auto &sites = tri_.sites();
    patches_.reserve(tri_.triangles().size());
    for (const auto &t : tri_.triangles())
    {
        const std::size_t idx[3] = {std::size_t(t.a), std::size_t(t.b), std::size_t(t.c)};
        std::array<Eigen::Vector2d, 3> V;
        std::array<double, 3> f;
        std::array<Eigen::Vector2d, 3> g;
        for (std::size_t m = 0; m < 3; m++)
        {
            V[m] = Eigen::Vector2d(sites[idx[m]].x, sites[idx[m]].y);
            f[m] = sites[idx[m]].z;
            g[m] = gradients_[idx[m]];
        }
        patches_.push_back(buildPatch(V, f, g));
    }
}

double CloughTocherInterpolator::operator()(double x, double y) const
{
    std::array<double, 3> bary{};
    const int t = tri_.findTriangle(x, y, bary);
    if (t < 0)
        return std::numeric_limits<double>::quiet_NaN();
    return evaluatePatch(patches_[std::size_t(t)], bary);
}

/*****************************************************************************
 * 3) Grid passes
 ****************************************************************************/
static std::size_t smoothPass(const CloughTocherInterpolator &interp, TerrainGrid &grid)
{
    const Eigen::Index rows = grid.x.rows();
    const Eigen::Index cols = grid.x.cols();
    grid.z.resize(rows, cols);

    std::size_t defined = 0;
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic) reduction(+ : defined)
#endif
    for (Eigen::Index i = 0; i < rows; i++)
    {
        for (Eigen::Index j = 0; j < cols; j++)
        {
            const double z = interp(grid.x(i, j), grid.y(i, j));
            grid.z(i, j) = z;
            if (!std::isnan(z)) defined++;
        }
    }
    return defined;
}

std::size_t interpolateSmooth(const std::vector<Point3D> &samples, TerrainGrid &grid)
{
    const CloughTocherInterpolator interp(samples);
    return smoothPass(interp, grid);
}

std::size_t fillFromNearest(const std::vector<Point3D> &samples, TerrainGrid &grid)
{
    const SampleIndex index(samples);

    const Eigen::Index rows = grid.z.rows();
    const Eigen::Index cols = grid.z.cols();

    std::size_t filled = 0;
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic) reduction(+ : filled)
#endif
    for (Eigen::Index i = 0; i < rows; i++)
    {
        for (Eigen::Index j = 0; j < cols; j++)
        {
            if (!std::isnan(grid.z(i, j))) continue;
            grid.z(i, j) = samples[index.nearest(grid.x(i, j), grid.y(i, j))].z;
            filled++;
        }
    }
    return filled;
}

InterpolationSummary interpolateSurface(const std::vector<Point3D> &samples, TerrainGrid &grid)
{
    if (samples.empty())
        throw EmptyInputError("cannot interpolate a surface without terrain samples");

    const CloughTocherInterpolator interp(samples);

    InterpolationSummary summary;
    summary.triangles   = interp.triangulation().triangles().size();
    summary.smoothNodes = smoothPass(interp, grid);
    summary.filledNodes = fillFromNearest(samples, grid);
    return summary;
}

TerrainSurface buildTerrainSurface(const std::vector<Point3D> &samples, int resolution)
{
    TerrainSurface surface;
    surface.grid    = buildGrid(samples, resolution);
    surface.summary = interpolateSurface(samples, surface.grid);
    return surface;
}

} // namespace topoalign
