#include "topoalign/writers.hpp"

#include "topoalign/exaggeration.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace topoalign
{

/*****************************************************************************
 * Grid XYZ
 ****************************************************************************/
bool writeGridXYZ(const std::string &outputFileName,
                  const TerrainGrid &grid,
                  int precision,
                  double exaggeration)
{
    const Eigen::MatrixXd zOut = exaggerate(grid.z, exaggeration);

    std::ofstream outFile(outputFileName);
    if (!outFile.is_open())
    {
        std::cerr << "Error creating grid XYZ file: " << outputFileName << std::endl;
        return false;
    }
    outFile << std::fixed << std::setprecision(precision);

    for (Eigen::Index i = 0; i < grid.x.rows(); i++)
    {
        for (Eigen::Index j = 0; j < grid.x.cols(); j++)
        {
            outFile << grid.x(i, j) << " " << grid.y(i, j) << " " << zOut(i, j) << "\n";
        }
    }
    return static_cast<bool>(outFile);
}

/*****************************************************************************
 * DXF
 ****************************************************************************/
bool writeDXF(const std::string &outputFileName,
              const std::vector<Point3D> &surveyPoints,
              const TerrainGrid &grid,
              const Alignment *alignment,
              int precision,
              int pdmode,
              double exaggeration)
{
    const Eigen::MatrixXd zGrid = exaggerate(grid.z, exaggeration);

    std::ofstream outFile(outputFileName);
    if (!outFile.is_open())
    {
        std::cerr << "Error creating DXF file: " << outputFileName << std::endl;
        return false;
    }
    outFile << std::fixed << std::setprecision(precision);

    outFile << "0\nSECTION\n2\nHEADER\n"
            << "9\n$PDMODE\n70\n" << pdmode << "\n"
            << "9\n$PDSIZE\n40\n0.5\n"
            << "0\nENDSEC\n"
            << "0\nSECTION\n2\nTABLES\n"
            << "0\nTABLE\n2\nLAYER\n"
            << "0\nLAYER\n2\nsurvey_points\n70\n0\n62\n7\n6\nCONTINUOUS\n"
            << "0\nLAYER\n2\nsurvey_labels\n70\n0\n62\n3\n6\nCONTINUOUS\n"
            << "0\nLAYER\n2\ngrid_points\n70\n0\n62\n5\n6\nCONTINUOUS\n"
            << "0\nLAYER\n2\nstations\n70\n0\n62\n1\n6\nCONTINUOUS\n"
            << "0\nLAYER\n2\nstation_labels\n70\n0\n62\n4\n6\nCONTINUOUS\n"
            << "0\nLAYER\n2\npipeline\n70\n0\n62\n6\n6\nCONTINUOUS\n"
            << "0\nENDTAB\n"
            << "0\nTABLE\n2\nVPORT\n"
            << "0\nVPORT\n2\n*ACTIVE\n10\n0.0\n20\n0.0\n11\n1.0\n21\n1.0\n12\n0.0\n22\n0.0\n40\n100.0\n"
            << "0\nENDTAB\n"
            << "0\nENDSEC\n"
            << "0\nSECTION\n2\nENTITIES\n";

    auto writePoint = [&](double x, double y, double z, const std::string &layer) {
        outFile << "0\nPOINT\n8\n" << layer
                << "\n10\n" << x
                << "\n20\n" << y
                << "\n30\n" << z << "\n";
    };
    auto writeLabel = [&](double x, double y, const std::string &layer, const std::string &text) {
        outFile << "0\nTEXT\n8\n" << layer
                << "\n10\n" << (x + 0.2)
                << "\n20\n" << (y + 0.2)
                << "\n30\n0.0\n40\n1.0\n1\n" << text << "\n";
    };
    auto formatElevation = [&](double z) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << z;
        return ss.str();
    };

    for (const auto &p : surveyPoints)
    {
        writePoint(p.x, p.y, exaggerate(p.z, exaggeration), "survey_points");
        writeLabel(p.x, p.y, "survey_labels", formatElevation(p.z));
    }

    for (Eigen::Index i = 0; i < grid.x.rows(); i++)
    {
        for (Eigen::Index j = 0; j < grid.x.cols(); j++)
        {
            writePoint(grid.x(i, j), grid.y(i, j), zGrid(i, j), "grid_points");
        }
    }

    if (alignment)
    {
        for (const SurveyPoint *s : {&alignment->stations.a, &alignment->stations.b})
        {
            writePoint(s->northing, s->easting, exaggerate(s->elevation, exaggeration), "stations");
            std::string text = (s->station ? toString(*s->station) : std::string("?")) +
                               " (" + formatElevation(s->elevation) + "m)";
            if (!s->description.empty()) text += " " + s->description;
            writeLabel(s->northing, s->easting, "station_labels", text);
        }

        const AlignmentCurve path = exaggerate(alignment->curve, exaggeration);
        for (std::size_t k = 1; k < path.size(); k++)
        {
            outFile << "0\nLINE\n8\npipeline"
                    << "\n10\n" << path.pathX[k - 1]
                    << "\n20\n" << path.pathY[k - 1]
                    << "\n30\n" << path.pathZ[k - 1]
                    << "\n11\n" << path.pathX[k]
                    << "\n21\n" << path.pathY[k]
                    << "\n31\n" << path.pathZ[k] << "\n";
        }
    }

    outFile << "0\nENDSEC\n0\nEOF\n";
    return static_cast<bool>(outFile);
}

/*****************************************************************************
 * Report
 ****************************************************************************/
bool writeReport(const std::string &outputFileName, const std::vector<std::string> &lines)
{
    std::ofstream rptFile(outputFileName);
    if (!rptFile.is_open())
    {
        std::cerr << "Error creating report file: " << outputFileName << std::endl;
        return false;
    }
    for (const auto &line : lines)
    {
        rptFile << line << "\n";
    }
    return static_cast<bool>(rptFile);
}

} // namespace topoalign
