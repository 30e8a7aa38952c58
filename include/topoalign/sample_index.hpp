/*****************************************************************************
 * sample_index.hpp
 * ----------------
 * Uniform bin grid over the samples for nearest-sample queries in the
 * northing/easting plane. Ties go to the earliest sample in input order.
 *****************************************************************************/
#ifndef TOPOALIGN_SAMPLE_INDEX_HPP
#define TOPOALIGN_SAMPLE_INDEX_HPP

#include "topoalign/point_set.hpp"

#include <cstddef>
#include <vector>

namespace topoalign
{

class SampleIndex
{
public:
    /// \throws EmptyInputError if \p samples is empty.
    explicit SampleIndex(const std::vector<Point3D> &samples);

    /// Index (into the constructor's vector) of the sample nearest (x, y).
    std::size_t nearest(double x, double y) const;

    std::size_t size() const { return samples_.size(); }

private:
    std::vector<Point3D> samples_;
    double xMin_ = 0.0, yMin_ = 0.0;
    double cellWidth_ = 1.0, cellHeight_ = 1.0;
    std::size_t gridCount_ = 1;
    std::vector<std::vector<std::size_t>> cells_;
};

} // namespace topoalign

#endif // TOPOALIGN_SAMPLE_INDEX_HPP
