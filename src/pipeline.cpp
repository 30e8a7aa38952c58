#include "topoalign/pipeline.hpp"

#include "topoalign/errors.hpp"
#include "topoalign/writers.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace topoalign
{

void validateOptions(const ProcessOptions &options)
{
    if (options.precision < 0)
        throw InvalidParameterError("precision must be >= 0");
    if (options.resolution < 1)
        throw InvalidParameterError("resolution must be >= 1");
    if (options.curveSamples < 2)
        throw InvalidParameterError("curve sample count must be >= 2");
    if (!std::isfinite(options.sag))
        throw InvalidParameterError("sag must be finite");
    checkExaggeration(options.exaggeration);
}

std::size_t parseCurveSamples(const std::string &text)
{
    std::size_t used = 0;
    const long value = std::stol(text, &used);
    if (used != text.size())
        throw InvalidParameterError("curve sample count is not an integer: " + text);
    if (value < 2)
        throw InvalidParameterError("curve sample count must be >= 2");
    return static_cast<std::size_t>(value);
}

TerrainModel buildTerrainModel(const PointSet &points,
                               const ProcessOptions &options,
                               TerrainCache &cache,
                               const StatusCallback &statusCallback)
{
    validateOptions(options);

    auto statusUpdate = [&](const std::string &msg) {
        if (statusCallback) statusCallback(msg);
    };

    TerrainModel model;
    model.points     = points;
    model.statistics = points.statistics();
    {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(options.precision)
            << "Survey points: " << model.statistics.surveyPoints
            << ", elevation " << model.statistics.minElevation
            << " .. " << model.statistics.maxElevation
            << " (relief " << model.statistics.relief << ")";
        statusUpdate(msg.str());
    }
    {
        const PlaneBounds &b = model.statistics.bounds;
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(options.precision)
            << "Extent: northing " << b.minNorthing << " .. " << b.maxNorthing
            << ", easting " << b.minEasting << " .. " << b.maxEasting;
        statusUpdate(msg.str());
    }

    // 1) Terrain
    {
        std::ostringstream msg;
        msg << "Building " << options.resolution << "x" << options.resolution << " terrain grid ...";
        statusUpdate(msg.str());
    }
    model.surface = cache.surface(points, options.resolution);
    {
        const InterpolationSummary &s = model.surface->summary;
        std::ostringstream msg;
        msg << "Triangles: " << s.triangles
            << ", smooth nodes: " << s.smoothNodes
            << ", filled from nearest sample: " << s.filledNodes;
        statusUpdate(msg.str());
    }

    // 2) Alignment
    statusUpdate("Computing A-B alignment ...");
    try
    {
        std::shared_ptr<const Alignment> alignment =
            cache.alignment(points.alignmentStations(), options.sag, options.curveSamples);
        model.alignment = *alignment;

        std::ostringstream msg;
        msg << std::fixed << std::setprecision(options.precision)
            << "Distance: " << alignment->metrics.distance
            << ", slope: " << alignment->metrics.slopePercent << "%"
            << ", elevation gain: " << alignment->metrics.elevationGain
            << ", curve samples: " << alignment->curve.size();
        statusUpdate(msg.str());
    }
    catch (const InvalidStationsError &e)
    {
        model.alignmentSkipReason = e.what();
        statusUpdate(std::string("Alignment skipped: ") + e.what());
    }

    return model;
}

TerrainModel processSurveyFile(const std::string &inputFileName,
                               const ProcessOptions &options,
                               const StatusCallback &statusUpdate)
{
    validateOptions(options);

    std::vector<std::string> reportLines;
    auto reportStatus = [&](const std::string &msg) {
        reportLines.push_back(msg);
        if (statusUpdate) statusUpdate(msg);
    };

    auto startTime = std::chrono::high_resolution_clock::now();

    // 1) Read input
    reportStatus("Reading input file: " + inputFileName + " ...");
    std::size_t skipped = 0;
    PointSet points = readSurveyFile(inputFileName, skipped);
    {
        std::ostringstream msg;
        msg << "Total points read: " << points.points().size()
            << " (water_dist: " << points.waterDistPoints().size() << ")";
        reportStatus(msg.str());
    }
    if (skipped > 0)
    {
        std::ostringstream msg;
        msg << "Skipped malformed lines: " << skipped;
        reportStatus(msg.str());
    }

    // 2) Terrain + alignment
    TerrainCache cache;
    TerrainModel model = buildTerrainModel(points, options, cache, reportStatus);

    // 3) Outputs
    reportStatus("Writing grid.xyz ...");
    if (!writeGridXYZ(inputFileName + ".grid.xyz", model.surface->grid,
                      options.precision, options.exaggeration))
        reportStatus("Error: Unable to write " + inputFileName + ".grid.xyz");

    reportStatus("Generating DXF ...");
    const Alignment *alignment = model.alignment ? &*model.alignment : nullptr;
    if (!writeDXF(inputFileName + ".dxf", points.terrainSamples(), model.surface->grid,
                  alignment, options.precision, options.pdmode, options.exaggeration))
        reportStatus("Error: Unable to write " + inputFileName + ".dxf");

    auto endTime = std::chrono::high_resolution_clock::now();
    double elapsedSec = std::chrono::duration<double>(endTime - startTime).count();
    std::ostringstream finishMsg;
    finishMsg << "Done. Total time: " << std::round(elapsedSec) << " sec.";
    reportStatus(finishMsg.str());

    const std::string reportFileName = inputFileName + ".rpt.txt";
    if (!writeReport(reportFileName, reportLines) && statusUpdate)
        statusUpdate("Error: Unable to create report file: " + reportFileName);

    return model;
}

} // namespace topoalign
