/*****************************************************************************
 * alignment_curve.hpp
 * -------------------
 * Pipeline alignment between station A and station B:
 *
 *   distance      planar (northing/easting) distance A-B
 *   slope         (z_B - z_A) / distance * 100, signed percent
 *   sag curve     planar coordinates linear in t, elevation the quadratic
 *                 Bezier with control elevation (z_A + z_B) / 2 - sag:
 *
 *                 z(t) = (1-t)^2 z_A + 2(1-t)t z_mid + t^2 z_B
 *
 * t runs uniformly over [0, 1] in N samples, both ends included.
 *****************************************************************************/
#ifndef TOPOALIGN_ALIGNMENT_CURVE_HPP
#define TOPOALIGN_ALIGNMENT_CURVE_HPP

#include "topoalign/point_set.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace topoalign
{

constexpr double      kDefaultSag          = 1.0;
constexpr std::size_t kDefaultCurveSamples = 50;

struct AlignmentMetrics
{
    double distance      = 0.0;
    double slopePercent  = 0.0;
    double elevationGain = 0.0;   ///< z_B - z_A
};

struct AlignmentCurve
{
    std::vector<double> pathX;    ///< northing
    std::vector<double> pathY;    ///< easting
    std::vector<double> pathZ;    ///< elevation
    double controlElevation = 0.0;

    std::size_t size() const { return pathZ.size(); }
};

struct Alignment
{
    StationPair stations;
    AlignmentMetrics metrics;
    AlignmentCurve curve;
};

double planarDistance(const SurveyPoint &a, const SurveyPoint &b);

/// \throws InvalidStationsError if a and b coincide in the plane.
double slopePercent(const SurveyPoint &a, const SurveyPoint &b);

/// \throws InvalidStationsError if a and b coincide in the plane.
AlignmentMetrics computeAlignmentMetrics(const SurveyPoint &a, const SurveyPoint &b);

/// Elevation of the sag curve at parameter t in [0, 1].
double sagElevation(double zA, double zB, double sag, double t);

/**
 * \throws InvalidStationsError if a and b coincide in the plane.
 * \throws InvalidParameterError if sampleCount < 2.
 */
AlignmentCurve generateSagCurve(const SurveyPoint &a, const SurveyPoint &b,
                                double sag = kDefaultSag,
                                std::size_t sampleCount = kDefaultCurveSamples);

Alignment computeAlignment(const StationPair &stations,
                           double sag = kDefaultSag,
                           std::size_t sampleCount = kDefaultCurveSamples);

/**
 * \brief Alignment of a survey, or nothing when its stations are unusable.
 *        The reason for skipping is stored in \p skipReason when given.
 */
std::optional<Alignment> tryComputeAlignment(const PointSet &points,
                                             double sag = kDefaultSag,
                                             std::size_t sampleCount = kDefaultCurveSamples,
                                             std::string *skipReason = nullptr);

} // namespace topoalign

#endif // TOPOALIGN_ALIGNMENT_CURVE_HPP
