/*****************************************************************************
 * pipeline.hpp
 * ------------
 * End-to-end processing of one survey file:
 *
 *   1) Read the survey points
 *   2) Build the terrain grid (smooth pass + nearest-sample fallback)
 *   3) Compute the A-B alignment (skipped, not fatal, when the stations
 *      are missing or unusable)
 *   4) Write <input>.grid.xyz, <input>.dxf and <input>.rpt.txt
 *
 * Progress goes through a status callback; every status line is also kept
 * for the report file.
 *****************************************************************************/
#ifndef TOPOALIGN_PIPELINE_HPP
#define TOPOALIGN_PIPELINE_HPP

#include "topoalign/alignment_curve.hpp"
#include "topoalign/exaggeration.hpp"
#include "topoalign/grid_builder.hpp"
#include "topoalign/point_set.hpp"
#include "topoalign/surface_interpolator.hpp"
#include "topoalign/terrain_cache.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace topoalign
{

using StatusCallback = std::function<void(const std::string &)>;

struct ProcessOptions
{
    int precision        = 3;                     ///< decimal places in outputs
    int pdmode           = 3;                     ///< DXF point style
    int resolution       = kDefaultResolution;    ///< nodes per axis
    double exaggeration  = kDefaultExaggeration;  ///< output-only z scale
    double sag           = kDefaultSag;
    std::size_t curveSamples = kDefaultCurveSamples;
};

/// \throws InvalidParameterError on the first invalid field.
void validateOptions(const ProcessOptions &options);

/**
 * \brief Command-line sample count. Negative values are rejected before
 *        the conversion to an unsigned count.
 * \throws InvalidParameterError when the value is below 2 or has trailing text.
 */
std::size_t parseCurveSamples(const std::string &text);

struct TerrainModel
{
    PointSet points;
    SurveyStatistics statistics;
    std::shared_ptr<const TerrainSurface> surface;
    std::optional<Alignment> alignment;
    std::string alignmentSkipReason;   ///< set when alignment is empty
};

/**
 * \brief Terrain surface and alignment of an already loaded survey. Terrain
 *        failures propagate; alignment failures leave model.alignment empty.
 */
TerrainModel buildTerrainModel(const PointSet &points,
                               const ProcessOptions &options,
                               TerrainCache &cache,
                               const StatusCallback &statusUpdate);

/**
 * \brief Read, build and write all outputs next to \p inputFileName.
 * \throws TerrainError (or a subclass) on unreadable input, missing
 *         terrain samples or invalid options.
 */
TerrainModel processSurveyFile(const std::string &inputFileName,
                               const ProcessOptions &options,
                               const StatusCallback &statusUpdate);

} // namespace topoalign

#endif // TOPOALIGN_PIPELINE_HPP
