/*!
 * \file triangulation_test.cpp
 * \brief Delaunay triangulation: counts, orientation, empty circumcircles, degenerate inputs, point location.
 */

#include "topoalign/triangulation.hpp"
#include <array>
#include <cassert>
#include <cmath>
#include <initializer_list>
#include <vector>

using namespace topoalign;

static double orient(const Point3D& a, const Point3D& b, const Point3D& c){
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

static bool strictlyInCircle(const Point3D& a, const Point3D& b, const Point3D& c, const Point3D& d){
    const double adx = a.x - d.x, ady = a.y - d.y;
    const double bdx = b.x - d.x, bdy = b.y - d.y;
    const double cdx = c.x - d.x, cdy = c.y - d.y;
    const double det = (adx * adx + ady * ady) * (bdx * cdy - cdx * bdy)
                     - (bdx * bdx + bdy * bdy) * (adx * cdy - cdx * ady)
                     + (cdx * cdx + cdy * cdy) * (adx * bdy - bdx * ady);
    return det > 1e-6;
}

// Rectangle 1000 x 300 whose long edges bow inward by amp at mid-span.
static std::vector<Point3D> bowedRectangle(double amp){
    const double pi = 3.14159265358979323846;
    std::vector<Point3D> pts;
    for (int k = 0; k <= 20; ++k){
        const double t = k / 20.0;
        pts.push_back({1000.0 * t, amp * std::sin(pi * t), 0.0});
        pts.push_back({1000.0 * t, 300.0 - amp * std::sin(pi * t), 0.0});
    }
    pts.push_back({0.0, 150.0, 0.0});
    pts.push_back({1000.0, 150.0, 0.0});
    unsigned seed = 2024u;
    auto next = [&seed](){ seed = seed * 1103515245u + 12345u; return double((seed >> 8) % 10000) / 10000.0; };
    for (int i = 0; i < 60; ++i) pts.push_back({50.0 + 900.0 * next(), 20.0 + 260.0 * next(), 0.0});
    return pts;
}

int main(){
    // Case 1: square splits into two triangles
    {
        Triangulation t({{0,0,0},{1,0,0},{1,1,0},{0,1,0}});
        assert(t.sites().size() == 4);
        assert(t.triangles().size() == 2);
    }

    // Case 2: scattered sites; CCW, Euler count, empty circumcircles
    {
        std::vector<Point3D> pts;
        for (int i = 0; i < 6; ++i)
            for (int j = 0; j < 6; ++j)
                pts.push_back({i * 10.0 + ((i * 7 + j * 3) % 5) * 0.9,
                               j * 10.0 + ((i * 2 + j * 5) % 7) * 0.7,
                               double(i + j)});
        Triangulation t(pts);
        assert(!t.empty());
        const auto& s = t.sites();
        for (const auto& tr : t.triangles()){
            assert(orient(s[tr.a], s[tr.b], s[tr.c]) > 0.0);
            for (std::size_t v = 0; v < s.size(); ++v){
                if (int(v) == tr.a || int(v) == tr.b || int(v) == tr.c) continue;
                assert(!strictlyInCircle(s[tr.a], s[tr.b], s[tr.c], s[v]));
            }
        }

        // neighbour lists are symmetric
        const auto nb = t.vertexNeighbors();
        for (std::size_t i = 0; i < nb.size(); ++i){
            assert(!nb[i].empty());
            for (int j : nb[i]){
                bool back = false;
                for (int k : nb[std::size_t(j)]) if (k == int(i)) back = true;
                assert(back);
            }
        }
    }

    // Case 3: fewer than three sites and collinear sites give no triangles
    {
        assert(Triangulation(std::vector<Point3D>{}).empty());
        assert(Triangulation({{0,0,1},{1,1,2}}).empty());
        Triangulation line({{0,0,1},{1,1,2},{2,2,3},{3,3,4}});
        assert(line.empty());
        std::array<double,3> bary{};
        assert(line.findTriangle(1.0, 1.0, bary) == -1);
    }

    // Case 4: coincident planar sites merge, first in input order wins
    {
        Triangulation t({{0,0,1},{1,0,2},{0,1,3},{0,0,99}});
        assert(t.sites().size() == 3);
        bool found = false;
        for (const auto& p : t.sites()) if (p.x == 0.0 && p.y == 0.0){ assert(p.z == 1.0); found = true; }
        assert(found);
        assert(t.triangles().size() == 1);
    }

    // Case 5: point location with barycentric weights
    {
        Triangulation t({{0,0,0},{4,0,0},{0,4,0}});
        std::array<double,3> bary{};
        const int k = t.findTriangle(1.0, 1.0, bary);
        assert(k == 0);
        assert(std::fabs(bary[0] + bary[1] + bary[2] - 1.0) < 1e-12);
        const auto& tr = t.triangles()[0];
        const auto& s = t.sites();
        const double x = bary[0] * s[tr.a].x + bary[1] * s[tr.b].x + bary[2] * s[tr.c].x;
        const double y = bary[0] * s[tr.a].y + bary[1] * s[tr.b].y + bary[2] * s[tr.c].y;
        assert(std::fabs(x - 1.0) < 1e-12 && std::fabs(y - 1.0) < 1e-12);

        assert(t.findTriangle(0.0, 0.0, bary) == 0);     // vertex
        assert(t.findTriangle(2.0, 2.0, bary) == 0);     // hypotenuse
        assert(t.findTriangle(3.0, 3.0, bary) == -1);    // outside
        assert(t.findTriangle(-1.0, 0.5, bary) == -1);
    }

    // Case 6: long hull edges bowed slightly inward are still covered
    {
        for (double amp : {1e-6, 0.01, 0.05, 0.1, 0.5}){
            Triangulation t(bowedRectangle(amp));
            const auto& s = t.sites();
            double area = 0.0;
            for (const auto& tr : t.triangles()){
                const double a = orient(s[tr.a], s[tr.b], s[tr.c]);
                assert(a > 0.0);
                area += 0.5 * a;
            }
            assert(std::fabs(area - 300000.0) < 1e-6 * 300000.0);

            std::array<double,3> bary{};
            for (int k = 0; k < 50; ++k){
                const double x = 1000.0 * k / 49.0;
                assert(t.findTriangle(x, 0.0, bary) >= 0);
                assert(t.findTriangle(x, 300.0, bary) >= 0);
            }
        }
    }
    return 0;
}
