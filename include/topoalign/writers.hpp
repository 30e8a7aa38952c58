/*****************************************************************************
 * writers.hpp
 * -----------
 * Output files of the converter. This is the presentation boundary: the
 * vertical exaggeration is applied here and nowhere upstream.
 *
 *   <input>.grid.xyz   one "northing easting elevation" line per node
 *   <input>.dxf        survey points, grid, stations, pipeline polyline
 *   <input>.rpt.txt    processing report
 *
 * Writers return false (after printing to std::cerr) when the file
 * cannot be created.
 *****************************************************************************/
#ifndef TOPOALIGN_WRITERS_HPP
#define TOPOALIGN_WRITERS_HPP

#include "topoalign/alignment_curve.hpp"
#include "topoalign/grid_builder.hpp"
#include "topoalign/point_set.hpp"

#include <string>
#include <vector>

namespace topoalign
{

bool writeGridXYZ(const std::string &outputFileName,
                  const TerrainGrid &grid,
                  int precision,
                  double exaggeration);

/**
 * \param alignment May be null; the station and pipeline layers are then
 *                  left empty.
 */
bool writeDXF(const std::string &outputFileName,
              const std::vector<Point3D> &surveyPoints,
              const TerrainGrid &grid,
              const Alignment *alignment,
              int precision,
              int pdmode,
              double exaggeration);

bool writeReport(const std::string &outputFileName,
                 const std::vector<std::string> &lines);

} // namespace topoalign

#endif // TOPOALIGN_WRITERS_HPP
