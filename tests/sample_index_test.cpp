/*!
 * \file sample_index_test.cpp
 * \brief Nearest-sample queries against brute force, tie-breaking by input order, empty input.
 */

#include "topoalign/errors.hpp"
#include "topoalign/sample_index.hpp"
#include <cassert>
#include <cstddef>
#include <vector>

using namespace topoalign;

static std::size_t bruteNearest(const std::vector<Point3D>& s, double x, double y){
    std::size_t best = 0;
    double bestD2 = (s[0].x - x) * (s[0].x - x) + (s[0].y - y) * (s[0].y - y);
    for (std::size_t i = 1; i < s.size(); ++i){
        const double d2 = (s[i].x - x) * (s[i].x - x) + (s[i].y - y) * (s[i].y - y);
        if (d2 < bestD2){ bestD2 = d2; best = i; }
    }
    return best;
}

int main(){
    // Case 1: agrees with brute force inside and outside the sample box
    {
        std::vector<Point3D> s;
        unsigned seed = 12345u;
        auto next = [&seed](){ seed = seed * 1103515245u + 12345u; return double((seed >> 8) % 10000) / 100.0; };
        for (int i = 0; i < 200; ++i) s.push_back({next(), next(), double(i)});
        SampleIndex index(s);
        assert(index.size() == 200);

        for (int qx = -20; qx <= 120; qx += 7){
            for (int qy = -20; qy <= 120; qy += 9){
                const std::size_t got = index.nearest(qx, qy);
                const std::size_t want = bruteNearest(s, qx, qy);
                const double dg = (s[got].x - qx) * (s[got].x - qx) + (s[got].y - qy) * (s[got].y - qy);
                const double dw = (s[want].x - qx) * (s[want].x - qx) + (s[want].y - qy) * (s[want].y - qy);
                assert(dg == dw);
                assert(got == want);
            }
        }
    }

    // Case 2: equidistant samples resolve to the earliest one
    {
        SampleIndex index({{2,0,5},{0,0,1},{1,1,7},{1,-1,3}});
        assert(index.nearest(1.0, 0.0) == 0);
    }

    // Case 3: duplicates resolve to the earliest one
    {
        SampleIndex index({{9,9,0},{3,3,1},{3,3,2}});
        assert(index.nearest(3.0, 3.0) == 1);
        assert(index.nearest(2.0, 2.0) == 1);
    }

    // Case 4: single sample, degenerate spans
    {
        SampleIndex one({{5,5,5}});
        assert(one.nearest(-100.0, 1e6) == 0);
        SampleIndex line({{0,0,0},{0,10,0},{0,20,0}});
        assert(line.nearest(3.0, 14.0) == 1);
        assert(line.nearest(-3.0, 16.0) == 2);
    }

    // Case 5: empty input
    {
        bool threw = false;
        try { SampleIndex index(std::vector<Point3D>{}); } catch (const EmptyInputError&) { threw = true; }
        assert(threw);
    }
    return 0;
}
