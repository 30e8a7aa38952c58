/*!
 * \file terrain_cache_test.cpp
 * \brief Memoized surfaces and alignments: hits share one result, keys separate, invalidate drops entries, concurrent readers.
 */

#include "topoalign/errors.hpp"
#include "topoalign/terrain_cache.hpp"
#include <cassert>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

using namespace topoalign;

static PointSet survey(const std::string& text){
    std::istringstream in(text);
    std::size_t skipped = 0;
    return readSurveyStream(in, skipped);
}

int main(){
    const PointSet ps = survey(
        "0 0 10\n10 0 12\n0 10 11\n10 10 15\n5 5 13\n"
        "0 0 100 water_dist A\n100 0 90 water_dist B\n");

    // Case 1: surface hit returns the same shared object
    {
        TerrainCache cache;
        auto s1 = cache.surface(ps, 8);
        auto s2 = cache.surface(ps, 8);
        assert(s1 == s2);
        assert(cache.hits() == 1 && cache.misses() == 1);
        assert(cache.size() == 1);
        assert(!s1->grid.hasUndefinedCells());

        // different resolution or samples is a separate entry
        auto s3 = cache.surface(ps, 9);
        assert(s3 != s1 && s3->grid.z.rows() == 9);
        const PointSet other = survey("0 0 10\n10 0 12\n0 10 11\n10 10 16\n5 5 13\n");
        auto s4 = cache.surface(other, 8);
        assert(s4 != s1);
        assert(cache.size() == 3);

        // station changes do not affect the surface key
        const PointSet moved = survey("0 0 10\n10 0 12\n0 10 11\n10 10 15\n5 5 13\n"
                                      "1 1 100 water_dist A\n100 0 90 water_dist B\n");
        assert(cache.surface(moved, 8) == s1);
    }

    // Case 2: alignment hit, keyed by sag and sample count
    {
        TerrainCache cache;
        const StationPair st = ps.alignmentStations();
        auto a1 = cache.alignment(st, 1.0, 50);
        auto a2 = cache.alignment(st, 1.0, 50);
        assert(a1 == a2);
        assert(a1->curve.size() == 50);
        assert(cache.alignment(st, 2.0, 50) != a1);
        assert(cache.alignment(st, 1.0, 10)->curve.size() == 10);
        assert(cache.size() == 3);

        bool threw = false;
        StationPair same{st.a, st.a};
        try { cache.alignment(same, 1.0, 50); } catch (const InvalidStationsError&) { threw = true; }
        assert(threw);
        assert(cache.size() == 3);
    }

    // Case 3: invalidate drops everything; held results stay valid
    {
        TerrainCache cache;
        auto s1 = cache.surface(ps, 6);
        cache.alignment(ps.alignmentStations(), 1.0, 20);
        assert(cache.size() == 2);
        cache.invalidate();
        assert(cache.size() == 0);
        auto s2 = cache.surface(ps, 6);
        assert(s2 != s1);
        assert(s2->grid.z == s1->grid.z);
    }

    // Case 4: concurrent callers converge on one stored entry
    {
        TerrainCache cache;
        std::vector<std::shared_ptr<const TerrainSurface>> results(4);
        std::vector<std::thread> workers;
        for (std::size_t i = 0; i < results.size(); ++i)
            workers.emplace_back([&cache, &ps, &results, i](){ results[i] = cache.surface(ps, 12); });
        for (auto& w : workers) w.join();
        assert(cache.size() == 1);
        auto stored = cache.surface(ps, 12);
        for (const auto& r : results) assert(r->grid.z == stored->grid.z);
    }

    // Case 5: empty terrain propagates
    {
        TerrainCache cache;
        bool threw = false;
        try { cache.surface(survey("0 0 1 water_dist A\n"), 5); } catch (const EmptyInputError&) { threw = true; }
        assert(threw);
        assert(cache.size() == 0);
    }

    // Case 6: station labels are part of the alignment key
    {
        TerrainCache cache;
        StationPair st = ps.alignmentStations();
        st.a.description = "intake";
        auto a1 = cache.alignment(st, 1.0, 50);
        assert(a1->stations.a.description == "intake");

        StationPair relabeled = st;
        relabeled.a.description = "new intake";
        auto a2 = cache.alignment(relabeled, 1.0, 50);
        assert(a2 != a1);
        assert(a2->stations.a.description == "new intake");
        assert(a2->curve.pathZ == a1->curve.pathZ);
        assert(cache.misses() == 2 && cache.hits() == 0);
        assert(cache.alignment(relabeled, 1.0, 50) == a2);
    }
    return 0;
}
