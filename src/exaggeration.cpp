#include "topoalign/exaggeration.hpp"

#include "topoalign/errors.hpp"

#include <cmath>
#include <sstream>

namespace topoalign
{

void checkExaggeration(double factor)
{
    if (!std::isfinite(factor) || factor <= 0.0)
    {
        std::ostringstream msg;
        msg << "exaggeration factor must be positive, got " << factor;
        throw InvalidParameterError(msg.str());
    }
}

double exaggerate(double elevation, double factor)
{
    checkExaggeration(factor);
    return elevation * factor;
}

Eigen::MatrixXd exaggerate(const Eigen::MatrixXd &elevations, double factor)
{
    checkExaggeration(factor);
    return elevations * factor;
}

AlignmentCurve exaggerate(const AlignmentCurve &curve, double factor)
{
    checkExaggeration(factor);
    AlignmentCurve scaled = curve;
    for (auto &z : scaled.pathZ)
        z *= factor;
    scaled.controlElevation *= factor;
    return scaled;
}

} // namespace topoalign
