/*****************************************************************************
 * topoalign.cpp
 * -------------
 * Command-line front end: survey file in, terrain grid + pipeline alignment
 * out (.grid.xyz, .dxf, .rpt.txt next to the input file).
 *
 * Input lines:
 *   northing easting elevation [topo_survey|water_dist [A|B|- [description]]]
 *
 * Usage:
 *   topoalign <Input_File> <Precision> <PDMODE> [Resolution] [Exaggeration] [Sag] [CurveSamples]
 * Example:
 *   topoalign survey.txt 2 3 50 20 1.0 50
 *****************************************************************************/

#include "topoalign/errors.hpp"
#include "topoalign/pipeline.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <string>

static void printUsage(const char *program)
{
    std::cerr << "Usage:\n"
              << "  " << program << " <Input_File> <Precision> <PDMODE> [Resolution] [Exaggeration] [Sag] [CurveSamples]\n\n"
              << "  <Input_File>   = survey file path\n"
              << "  <Precision>    = Decimal places in outputs (int)\n"
              << "  <PDMODE>       = DXF point style (int)\n"
              << "  [Resolution]   = (optional) grid nodes per axis, default=50\n"
              << "  [Exaggeration] = (optional) vertical scale of the outputs, default=20\n"
              << "  [Sag]          = (optional) pipeline sag below the A-B chord, default=1.0\n"
              << "  [CurveSamples] = (optional) points along the pipeline, default=50\n\n"
              << "Example:\n"
              << "  " << program << " survey.txt 2 3 50 20 1.0 50\n";
}

/*****************************************************************************
 * MAIN (Command-Line)
 ****************************************************************************/
int main(int argc, char *argv[])
{
    if (argc < 4)
    {
        printUsage(argv[0]);
        return 1;
    }

    std::string inputFile = argv[1];
    topoalign::ProcessOptions options;
    try
    {
        // Mandatory args:
        options.precision = std::stoi(argv[2]);
        options.pdmode    = std::stoi(argv[3]);

        // Optional:
        if (argc >= 5) options.resolution   = std::stoi(argv[4]);
        if (argc >= 6) options.exaggeration = std::stod(argv[5]);
        if (argc >= 7) options.sag          = std::stod(argv[6]);
        if (argc >= 8) options.curveSamples = topoalign::parseCurveSamples(argv[7]);

        topoalign::validateOptions(options);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Invalid argument: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    // Status callback -> print to console
    auto statusUpdate = [&](const std::string &msg) {
        std::cout << msg << std::endl;
    };

    try
    {
        topoalign::processSurveyFile(inputFile, options, statusUpdate);
    }
    catch (const topoalign::TerrainError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
