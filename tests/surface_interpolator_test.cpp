/*!
 * \file surface_interpolator_test.cpp
 * \brief Terrain reconstruction: saturation, exactness at sites, linear reproduction, hole filling, degenerate inputs.
 */

#include "topoalign/errors.hpp"
#include "topoalign/surface_interpolator.hpp"
#include <cassert>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <vector>

using namespace topoalign;

static double plane(double x, double y){ return 2.0 * x - 0.5 * y + 100.0; }

static bool saturated(const TerrainGrid& g){
    for (Eigen::Index i = 0; i < g.z.rows(); ++i)
        for (Eigen::Index j = 0; j < g.z.cols(); ++j)
            if (!std::isfinite(g.z(i, j))) return false;
    return !g.hasUndefinedCells();
}

// 1000 x 300 survey whose long edges bow inward by amp at mid-span.
static std::vector<Point3D> bowedSurvey(double amp){
    const double pi = 3.14159265358979323846;
    auto ground = [](double x, double y){ return 50.0 + 0.01 * x + 0.02 * y; };
    std::vector<Point3D> pts;
    for (int k = 0; k <= 20; ++k){
        const double x = 50.0 * k;
        const double yb = amp * std::sin(pi * k / 20.0);
        const double yt = 300.0 - yb;
        pts.push_back({x, yb, ground(x, yb)});
        pts.push_back({x, yt, ground(x, yt)});
    }
    pts.push_back({0.0, 150.0, ground(0.0, 150.0)});
    pts.push_back({1000.0, 150.0, ground(1000.0, 150.0)});
    unsigned seed = 77u;
    auto next = [&seed](){ seed = seed * 1103515245u + 12345u; return double((seed >> 8) % 10000) / 10000.0; };
    for (int i = 0; i < 60; ++i){
        const double x = 50.0 + 900.0 * next();
        const double y = 20.0 + 260.0 * next();
        pts.push_back({x, y, ground(x, y)});
    }
    return pts;
}

int main(){
    // Case 1: unit square, one raised corner, R=2 hits the four corners
    {
        const std::vector<Point3D> s = {{0,0,0},{1,0,0},{0,1,0},{1,1,10}};
        TerrainSurface surf = buildTerrainSurface(s, 2);
        assert(surf.grid.z.size() == 4);
        assert(saturated(surf.grid));
        assert(std::fabs(surf.grid.z(1, 1) - 10.0) < 1e-9);
        assert(std::fabs(surf.grid.z(0, 0)) < 1e-9);
        assert(std::fabs(surf.grid.z(0, 1)) < 1e-9);
        assert(std::fabs(surf.grid.z(1, 0)) < 1e-9);
        assert(surf.summary.triangles == 2);
        assert(surf.summary.smoothNodes == 4 && surf.summary.filledNodes == 0);
    }

    // Case 2: exact at every site, linear data reproduced in the interior
    {
        std::vector<Point3D> s;
        for (int i = 0; i <= 8; ++i)
            for (int j = 0; j <= 8; ++j){
                const double x = i * 5.0 + ((i * 3 + j) % 4) * 0.6;
                const double y = j * 5.0 + ((i + j * 5) % 3) * 0.8;
                s.push_back({x, y, plane(x, y)});
            }
        CloughTocherInterpolator interp(s);
        assert(!interp.triangulation().empty());
        for (const auto& p : s){
            const double z = interp(p.x, p.y);
            assert(std::fabs(z - p.z) < 1e-8);
        }
        for (const auto& g : interp.gradients()){
            assert(std::fabs(g.x() - 2.0) < 1e-3);
            assert(std::fabs(g.y() + 0.5) < 1e-3);
        }
        for (double x = 6.0; x < 38.0; x += 2.3)
            for (double y = 6.0; y < 38.0; y += 1.9){
                const double z = interp(x, y);
                assert(!std::isnan(z));
                assert(std::fabs(z - plane(x, y)) < 1e-2);
            }
        assert(std::isnan(interp(-50.0, -50.0)));

        TerrainGrid grid = buildGrid(s, 25);
        InterpolationSummary sum = interpolateSurface(s, grid);
        assert(saturated(grid));
        assert(sum.smoothNodes + sum.filledNodes == 25u * 25u);
        assert(sum.smoothNodes > 0);
    }

    // Case 3: smooth surface stays close to a gentle quadratic
    {
        std::vector<Point3D> s;
        auto hill = [](double x, double y){ return 50.0 + 0.01 * (x - 20.0) * (x - 20.0) - 0.02 * x * y * 0.1; };
        for (int i = 0; i <= 10; ++i)
            for (int j = 0; j <= 10; ++j){
                const double x = i * 4.0 + ((i + 2 * j) % 3) * 0.5;
                const double y = j * 4.0 + ((2 * i + j) % 3) * 0.5;
                s.push_back({x, y, hill(x, y)});
            }
        CloughTocherInterpolator interp(s);
        for (double x = 6.0; x < 34.0; x += 3.1)
            for (double y = 6.0; y < 34.0; y += 2.7)
                assert(std::fabs(interp(x, y) - hill(x, y)) < 0.25);
    }

    // Case 4: fallback alone fills NaN nodes from the nearest sample
    {
        const std::vector<Point3D> s = {{0,0,1},{10,0,2},{0,10,3},{10,10,4}};
        TerrainGrid grid = buildGrid(s, 3);
        grid.z.setConstant(std::numeric_limits<double>::quiet_NaN());
        grid.z(1, 1) = 42.0;
        const std::size_t filled = fillFromNearest(s, grid);
        assert(filled == 8);
        assert(grid.z(1, 1) == 42.0);
        assert(grid.z(0, 0) == 1.0 && grid.z(2, 0) == 2.0);
        assert(grid.z(0, 2) == 3.0 && grid.z(2, 2) == 4.0);
        // (0,5) is equidistant from samples 0 and 2: earliest wins
        assert(grid.z(0, 1) == 1.0);
    }

    // Case 5: fewer than three samples, pure fallback
    {
        const std::vector<Point3D> s = {{0,0,7},{10,10,9}};
        TerrainSurface surf = buildTerrainSurface(s, 5);
        assert(saturated(surf.grid));
        assert(surf.summary.triangles == 0);
        assert(surf.summary.smoothNodes == 0 && surf.summary.filledNodes == 25);
        assert(surf.grid.z(0, 0) == 7.0 && surf.grid.z(4, 4) == 9.0);

        TerrainSurface single = buildTerrainSurface({{3,4,5}}, 4);
        assert(saturated(single.grid));
        for (Eigen::Index i = 0; i < 4; ++i)
            for (Eigen::Index j = 0; j < 4; ++j) assert(single.grid.z(i, j) == 5.0);
    }

    // Case 6: collinear samples, no triangles, still saturated
    {
        const std::vector<Point3D> s = {{0,0,1},{5,5,2},{10,10,3},{15,15,4}};
        TerrainGrid grid = buildGrid(s, 6);
        const std::size_t smooth = interpolateSmooth(s, grid);
        assert(smooth == 0);
        assert(grid.hasUndefinedCells());
        fillFromNearest(s, grid);
        assert(saturated(grid));
        assert(grid.z(0, 0) == 1.0 && grid.z(5, 5) == 4.0);
    }

    // Case 7: empty input
    {
        bool threw = false;
        try { buildTerrainSurface(std::vector<Point3D>{}, 10); } catch (const EmptyInputError&) { threw = true; }
        assert(threw);
        threw = false;
        TerrainGrid grid = buildGrid({{0,0,0}}, 2);
        try { interpolateSurface(std::vector<Point3D>{}, grid); } catch (const EmptyInputError&) { threw = true; }
        assert(threw);
    }

    // Case 8: grid rows on a slightly bowed hull edge come from the smooth pass
    {
        for (double amp : {1e-6, 0.01, 0.05, 0.1}){
            const std::vector<Point3D> s = bowedSurvey(amp);
            TerrainGrid grid = buildGrid(s, 50);
            const std::size_t smooth = interpolateSmooth(s, grid);
            assert(smooth == 50u * 50u);
            assert(!grid.hasUndefinedCells());
            for (Eigen::Index i = 0; i < 50; ++i){
                const double x = grid.x(i, 0);
                assert(std::fabs(grid.z(i, 0) - (50.0 + 0.01 * x)) < 0.1);
                assert(std::fabs(grid.z(i, 49) - (56.0 + 0.01 * x)) < 0.1);
            }
        }
    }
    return 0;
}
