/*****************************************************************************
 * exaggeration.hpp
 * ----------------
 * Vertical exaggeration for output only. Every function returns a scaled
 * copy; stored elevations and planar coordinates are never touched.
 *****************************************************************************/
#ifndef TOPOALIGN_EXAGGERATION_HPP
#define TOPOALIGN_EXAGGERATION_HPP

#include "topoalign/alignment_curve.hpp"

#include <Eigen/Dense>

namespace topoalign
{

constexpr double kDefaultExaggeration = 20.0;

/// \throws InvalidParameterError unless factor is finite and > 0.
void checkExaggeration(double factor);

double exaggerate(double elevation, double factor);
Eigen::MatrixXd exaggerate(const Eigen::MatrixXd &elevations, double factor);
AlignmentCurve exaggerate(const AlignmentCurve &curve, double factor);

} // namespace topoalign

#endif // TOPOALIGN_EXAGGERATION_HPP
