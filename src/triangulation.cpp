#include "topoalign/triangulation.hpp"

#include "topoalign/grid_builder.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace topoalign
{

namespace
{

struct Node
{
    double x, y;
};

struct WorkTriangle
{
    int v[3];
    double cx, cy, r2;
    bool complete;
};

// Circumcircle in coordinates relative to vertex a; false for collinear input.
bool circumcircle(const std::vector<Node> &nodes, WorkTriangle &t)
{
    const Node &A = nodes[std::size_t(t.v[0])];
    const Node &B = nodes[std::size_t(t.v[1])];
    const Node &C = nodes[std::size_t(t.v[2])];

    const double bx = B.x - A.x, by = B.y - A.y;
    const double cx = C.x - A.x, cy = C.y - A.y;
    const double d  = 2.0 * (bx * cy - by * cx);
    if (std::fabs(d) < 1e-20)
        return false;

    const double b2 = bx * bx + by * by;
    const double c2 = cx * cx + cy * cy;
    const double ux = (cy * b2 - by * c2) / d;
    const double uy = (bx * c2 - cx * b2) / d;

    t.cx = A.x + ux;
    t.cy = A.y + uy;
    t.r2 = ux * ux + uy * uy;
    t.complete = false;
    return true;
}

double orient(const Node &a, const Node &b, const Node &c)
{
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

// Convex hull of nodes [0, n), counter-clockwise, collinear points dropped.
std::vector<int> convexHull(const std::vector<Node> &nodes, std::size_t n)
{
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int i, int j) {
        const Node &a = nodes[std::size_t(i)];
        const Node &b = nodes[std::size_t(j)];
        if (a.x != b.x) return a.x < b.x;
        return a.y < b.y;
    });

    std::vector<int> hull(2 * n);
    std::size_t k = 0;
    for (std::size_t i = 0; i < n; i++)
    {
        while (k >= 2 && orient(nodes[std::size_t(hull[k - 2])], nodes[std::size_t(hull[k - 1])],
                                nodes[std::size_t(order[i])]) <= 0.0)
            k--;
        hull[k++] = order[i];
    }
    for (std::size_t i = n - 1, lower = k + 1; i > 0; i--)
    {
        while (k >= lower && orient(nodes[std::size_t(hull[k - 2])], nodes[std::size_t(hull[k - 1])],
                                    nodes[std::size_t(order[i - 1])]) <= 0.0)
            k--;
        hull[k++] = order[i - 1];
    }
    hull.resize(k > 0 ? k - 1 : 0);
    return hull;
}

// Triangulates the gap between hull edge a->b and the boundary chain
// chain[lo, hi) running from a to b. The chain vertex seeing a-b under the
// largest angle closes a triangle whose circumcircle holds no other chain
// vertex; both sides are then filled the same way.
void fillPocket(const std::vector<Node> &nodes, int a, int b,
                const std::vector<int> &chain, std::size_t lo, std::size_t hi,
                std::vector<Triangle> &out)
{
    if (lo >= hi) return;

    const Node &A = nodes[std::size_t(a)];
    const Node &B = nodes[std::size_t(b)];
    std::size_t best = lo;
    double bestCos = 2.0;
    for (std::size_t k = lo; k < hi; k++)
    {
        const Node &R = nodes[std::size_t(chain[k])];
        const double ax = A.x - R.x, ay = A.y - R.y;
        const double bx = B.x - R.x, by = B.y - R.y;
        const double len = std::sqrt((ax * ax + ay * ay) * (bx * bx + by * by));
        if (len == 0.0) continue;
        const double c = (ax * bx + ay * by) / len;
        if (c < bestCos)
        {
            bestCos = c;
            best = k;
        }
    }

    const int r = chain[best];
    // A chain vertex lying on a-b only splits the edge.
    if (orient(A, B, nodes[std::size_t(r)]) > 0.0)
        out.push_back({a, b, r});
    fillPocket(nodes, a, r, chain, lo, best, out);
    fillPocket(nodes, r, b, chain, best + 1, hi, out);
}

// The finite super-triangle can leave gaps along hull edges whose boundary
// samples sit just inside the chord. Walk the triangulation boundary between
// consecutive hull vertices and triangulate whatever lies between.
void closeHull(const std::vector<Node> &nodes, std::size_t n, std::vector<Triangle> &triangles)
{
    if (triangles.empty()) return;

    std::vector<std::pair<int, int>> edges;
    edges.reserve(3 * triangles.size());
    for (const auto &t : triangles)
    {
        edges.emplace_back(t.a, t.b);
        edges.emplace_back(t.b, t.c);
        edges.emplace_back(t.c, t.a);
    }
    std::sort(edges.begin(), edges.end());

    // Boundary edges have no twin; they run counter-clockwise.
    std::vector<int> next(n, -1);
    std::vector<int> outDegree(n, 0);
    for (const auto &e : edges)
    {
        if (std::binary_search(edges.begin(), edges.end(), std::make_pair(e.second, e.first)))
            continue;
        next[std::size_t(e.first)] = e.second;
        outDegree[std::size_t(e.first)]++;
    }

    const std::vector<int> hull = convexHull(nodes, n);
    std::vector<int> chain;
    for (std::size_t h = 0; h < hull.size(); h++)
    {
        const int a = hull[h];
        const int b = hull[(h + 1) % hull.size()];

        chain.clear();
        int v = a;
        bool reached = false;
        for (std::size_t steps = 0; steps < n; steps++)
        {
            if (outDegree[std::size_t(v)] != 1) break;
            v = next[std::size_t(v)];
            if (v == b)
            {
                reached = true;
                break;
            }
            chain.push_back(v);
        }
        if (!reached || chain.empty()) continue;

        bool gap = false;
        for (int c : chain)
        {
            if (orient(nodes[std::size_t(a)], nodes[std::size_t(b)], nodes[std::size_t(c)]) > 0.0)
                gap = true;
        }
        if (!gap) continue;

        fillPocket(nodes, a, b, chain, 0, chain.size(), triangles);
    }
}

} // namespace

/*****************************************************************************
 * Construction
 ****************************************************************************/
Triangulation::Triangulation(const std::vector<Point3D> &samples)
{
    // Merge coincident planar sites, keeping the earliest sample.
    std::vector<std::size_t> order(samples.size());
    std::iota(order.begin(), order.end(), std::size_t(0));
    std::stable_sort(order.begin(), order.end(), [&](std::size_t i, std::size_t j) {
        if (samples[i].x != samples[j].x) return samples[i].x < samples[j].x;
        return samples[i].y < samples[j].y;
    });

    std::vector<bool> keep(samples.size(), true);
    for (std::size_t k = 1; k < order.size(); k++)
    {
        const Point3D &prev = samples[order[k - 1]];
        const Point3D &cur  = samples[order[k]];
        if (prev.x == cur.x && prev.y == cur.y)
            keep[order[k]] = false;
    }

    sites_.reserve(samples.size());
    for (std::size_t i = 0; i < samples.size(); i++)
    {
        if (keep[i]) sites_.push_back(samples[i]);
    }

    triangulate();
    buildLocator();
}

void Triangulation::triangulate()
{
    const std::size_t n = sites_.size();
    if (n < 3) return;

    // Work in a unit box so the super-triangle and the tolerances are
    // independent of survey coordinates.
    const PlaneBounds box = computeBoundingBox(sites_);
    const double scale = std::max(box.maxNorthing - box.minNorthing,
                                  box.maxEasting - box.minEasting);
    if (scale <= 0.0) return;

    std::vector<Node> nodes(n + 3);
    for (std::size_t i = 0; i < n; i++)
    {
        nodes[i].x = (sites_[i].x - box.minNorthing) / scale;
        nodes[i].y = (sites_[i].y - box.minEasting) / scale;
    }
    const double M = 1.0e3;
    nodes[n]     = {0.5 - 2.0 * M, 0.5 - M};
    nodes[n + 1] = {0.5 + 2.0 * M, 0.5 - M};
    nodes[n + 2] = {0.5, 0.5 + 2.0 * M};

    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int i, int j) {
        const Node &a = nodes[std::size_t(i)];
        const Node &b = nodes[std::size_t(j)];
        if (a.x != b.x) return a.x < b.x;
        return a.y < b.y;
    });

    std::vector<WorkTriangle> work;
    work.reserve(2 * n + 1);
    {
        WorkTriangle super{{int(n), int(n + 1), int(n + 2)}, 0.0, 0.0, 0.0, false};
        circumcircle(nodes, super);
        work.push_back(super);
    }

    std::vector<std::pair<int, int>> edges;
    for (int idx : order)
    {
        const Node &p = nodes[std::size_t(idx)];
        edges.clear();

        for (std::size_t t = 0; t < work.size();)
        {
            WorkTriangle &w = work[t];
            if (w.complete)
            {
                t++;
                continue;
            }
            const double dx = p.x - w.cx;
            const double dy = p.y - w.cy;

            // Sites arrive sorted by x: a circle entirely to the left is final.
            if (dx > 0.0 && dx * dx > w.r2)
            {
                w.complete = true;
                t++;
                continue;
            }
            if (dx * dx + dy * dy < w.r2)
            {
                for (int e = 0; e < 3; e++)
                {
                    int u = w.v[e], v = w.v[(e + 1) % 3];
                    edges.emplace_back(std::min(u, v), std::max(u, v));
                }
                work[t] = work.back();
                work.pop_back();
                continue;
            }
            t++;
        }

        // Edges shared by two removed triangles are interior to the cavity.
        std::sort(edges.begin(), edges.end());
        for (std::size_t e = 0; e < edges.size();)
        {
            std::size_t run = e + 1;
            while (run < edges.size() && edges[run] == edges[e]) run++;
            if (run - e == 1)
            {
                WorkTriangle nt{{edges[e].first, edges[e].second, idx}, 0.0, 0.0, 0.0, false};
                if (circumcircle(nodes, nt))
                    work.push_back(nt);
            }
            e = run;
        }
    }

    for (const auto &w : work)
    {
        if (w.v[0] >= int(n) || w.v[1] >= int(n) || w.v[2] >= int(n))
            continue;

        Triangle tri{w.v[0], w.v[1], w.v[2]};
        const Node &A = nodes[std::size_t(tri.a)];
        const Node &B = nodes[std::size_t(tri.b)];
        const Node &C = nodes[std::size_t(tri.c)];
        const double cross = (B.x - A.x) * (C.y - A.y) - (B.y - A.y) * (C.x - A.x);
        if (cross == 0.0) continue;
        if (cross < 0.0) std::swap(tri.b, tri.c);
        triangles_.push_back(tri);
    }

    closeHull(nodes, n, triangles_);
}

/*****************************************************************************
 * Point location
 ****************************************************************************/
void Triangulation::buildLocator()
{
    bins_.clear();
    if (triangles_.empty()) return;

    const PlaneBounds box = computeBoundingBox(sites_);
    binCount_ = static_cast<std::size_t>(std::ceil(std::sqrt(double(triangles_.size()))));
    if (binCount_ == 0) binCount_ = 1;

    double width  = box.maxNorthing - box.minNorthing;
    double height = box.maxEasting - box.minEasting;
    if (width  <= 0.0) width  = 1.0;
    if (height <= 0.0) height = 1.0;

    binXMin_   = box.minNorthing;
    binYMin_   = box.minEasting;
    binWidth_  = width  / double(binCount_);
    binHeight_ = height / double(binCount_);
    bins_.assign(binCount_ * binCount_, {});

    auto binIndex = [&](double coord, double cmin, double spacing) {
        double r = std::floor((coord - cmin) / spacing);
        if (r < 0.0) r = 0.0;
        auto idx = static_cast<std::size_t>(r);
        if (idx >= binCount_) idx = binCount_ - 1;
        return idx;
    };

    for (std::size_t t = 0; t < triangles_.size(); t++)
    {
        const Triangle &tri = triangles_[t];
        const Point3D &A = sites_[std::size_t(tri.a)];
        const Point3D &B = sites_[std::size_t(tri.b)];
        const Point3D &C = sites_[std::size_t(tri.c)];

        const std::size_t ix0 = binIndex(std::min({A.x, B.x, C.x}), binXMin_, binWidth_);
        const std::size_t ix1 = binIndex(std::max({A.x, B.x, C.x}), binXMin_, binWidth_);
        const std::size_t iy0 = binIndex(std::min({A.y, B.y, C.y}), binYMin_, binHeight_);
        const std::size_t iy1 = binIndex(std::max({A.y, B.y, C.y}), binYMin_, binHeight_);

        for (std::size_t ix = ix0; ix <= ix1; ix++)
            for (std::size_t iy = iy0; iy <= iy1; iy++)
                bins_[ix * binCount_ + iy].push_back(int(t));
    }
}

int Triangulation::findTriangle(double x, double y, std::array<double, 3> &bary) const
{
    if (bins_.empty()) return -1;

    const double rx = std::floor((x - binXMin_) / binWidth_);
    const double ry = std::floor((y - binYMin_) / binHeight_);
    if (rx < -1.0 || ry < -1.0 || rx > double(binCount_) || ry > double(binCount_))
        return -1;

    std::size_t ix = rx < 0.0 ? 0 : static_cast<std::size_t>(rx);
    std::size_t iy = ry < 0.0 ? 0 : static_cast<std::size_t>(ry);
    if (ix >= binCount_) ix = binCount_ - 1;
    if (iy >= binCount_) iy = binCount_ - 1;

    const double eps = 1e-10;
    for (int t : bins_[ix * binCount_ + iy])
    {
        const Triangle &tri = triangles_[std::size_t(t)];
        const Point3D &A = sites_[std::size_t(tri.a)];
        const Point3D &B = sites_[std::size_t(tri.b)];
        const Point3D &C = sites_[std::size_t(tri.c)];

        const double v0x = B.x - A.x, v0y = B.y - A.y;
        const double v1x = C.x - A.x, v1y = C.y - A.y;
        const double v2x = x - A.x,   v2y = y - A.y;
        const double d = v0x * v1y - v1x * v0y;
        if (d == 0.0) continue;

        const double lb = (v2x * v1y - v1x * v2y) / d;
        const double lc = (v0x * v2y - v2x * v0y) / d;
        const double la = 1.0 - lb - lc;
        if (la >= -eps && lb >= -eps && lc >= -eps)
        {
            bary = {la, lb, lc};
            return t;
        }
    }
    return -1;
}

std::vector<std::vector<int>> Triangulation::vertexNeighbors() const
{
    std::vector<std::vector<int>> neighbors(sites_.size());
    for (const auto &tri : triangles_)
    {
        const int v[3] = {tri.a, tri.b, tri.c};
        for (int e = 0; e < 3; e++)
        {
            neighbors[std::size_t(v[e])].push_back(v[(e + 1) % 3]);
            neighbors[std::size_t(v[(e + 1) % 3])].push_back(v[e]);
        }
    }
    for (auto &list : neighbors)
    {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }
    return neighbors;
}

} // namespace topoalign
