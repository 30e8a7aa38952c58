#include "topoalign/alignment_curve.hpp"

#include "topoalign/errors.hpp"

#include <cmath>

namespace topoalign
{

double planarDistance(const SurveyPoint &a, const SurveyPoint &b)
{
    const double dn = b.northing - a.northing;
    const double de = b.easting - a.easting;
    return std::sqrt(dn * dn + de * de);
}

static double requirePlanarDistance(const SurveyPoint &a, const SurveyPoint &b)
{
    const double dist = planarDistance(a, b);
    if (dist == 0.0)
        throw InvalidStationsError("stations A and B share the same planar position");
    return dist;
}

double slopePercent(const SurveyPoint &a, const SurveyPoint &b)
{
    const double dist = requirePlanarDistance(a, b);
    return (b.elevation - a.elevation) / dist * 100.0;
}

AlignmentMetrics computeAlignmentMetrics(const SurveyPoint &a, const SurveyPoint &b)
{
    AlignmentMetrics m;
    m.distance      = requirePlanarDistance(a, b);
    m.elevationGain = b.elevation - a.elevation;
    m.slopePercent  = m.elevationGain / m.distance * 100.0;
    return m;
}

double sagElevation(double zA, double zB, double sag, double t)
{
    const double zMid = 0.5 * (zA + zB) - sag;
    const double s = 1.0 - t;
    return s * s * zA + 2.0 * s * t * zMid + t * t * zB;
}

AlignmentCurve generateSagCurve(const SurveyPoint &a, const SurveyPoint &b,
                                double sag, std::size_t sampleCount)
{
    requirePlanarDistance(a, b);
    if (sampleCount < 2)
        throw InvalidParameterError("sag curve needs at least two samples");

    AlignmentCurve curve;
    curve.controlElevation = 0.5 * (a.elevation + b.elevation) - sag;
    curve.pathX.resize(sampleCount);
    curve.pathY.resize(sampleCount);
    curve.pathZ.resize(sampleCount);

    const double dn = b.northing - a.northing;
    const double de = b.easting - a.easting;
    for (std::size_t k = 0; k < sampleCount; k++)
    {
        const double t = double(k) / double(sampleCount - 1);
        curve.pathX[k] = a.northing + dn * t;
        curve.pathY[k] = a.easting + de * t;
        curve.pathZ[k] = sagElevation(a.elevation, b.elevation, sag, t);
    }

    // Pin the anchors exactly.
    curve.pathX.front() = a.northing;
    curve.pathY.front() = a.easting;
    curve.pathZ.front() = a.elevation;
    curve.pathX.back()  = b.northing;
    curve.pathY.back()  = b.easting;
    curve.pathZ.back()  = b.elevation;
    return curve;
}

Alignment computeAlignment(const StationPair &stations, double sag, std::size_t sampleCount)
{
    Alignment result;
    result.stations = stations;
    result.metrics  = computeAlignmentMetrics(stations.a, stations.b);
    result.curve    = generateSagCurve(stations.a, stations.b, sag, sampleCount);
    return result;
}

std::optional<Alignment> tryComputeAlignment(const PointSet &points, double sag,
                                             std::size_t sampleCount, std::string *skipReason)
{
    try
    {
        return computeAlignment(points.alignmentStations(), sag, sampleCount);
    }
    catch (const InvalidStationsError &e)
    {
        if (skipReason) *skipReason = e.what();
        return std::nullopt;
    }
}

} // namespace topoalign
