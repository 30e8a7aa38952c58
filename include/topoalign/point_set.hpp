/*****************************************************************************
 * point_set.hpp
 * -------------
 * Survey point model: terrain samples plus the two water-distribution
 * stations (A, B) that anchor the pipeline alignment.
 *
 * Input file layout (one point per line, '#' starts a comment line,
 * commas are treated as blanks):
 *
 *   northing easting elevation [source [station [description ...]]]
 *
 *   source  = topo_survey (default) | water_dist
 *   station = A | B | -
 *****************************************************************************/
#ifndef TOPOALIGN_POINT_SET_HPP
#define TOPOALIGN_POINT_SET_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace topoalign
{

/*****************************************************************************
 * Enums & Structs
 ****************************************************************************/
enum class SurveySource
{
    TopoSurvey,
    WaterDist
};

enum class Station
{
    A,
    B
};

/**
 * \brief Planar/elevation triple used by the numeric modules.
 *        x = northing, y = easting, z = elevation.
 */
struct Point3D
{
    double x, y, z;
    bool operator==(const Point3D &other) const
    {
        return (x == other.x && y == other.y && z == other.z);
    }
};

struct Point3DHash
{
    std::size_t operator()(const Point3D &p) const;
};

struct PlaneBounds
{
    double minNorthing, maxNorthing;
    double minEasting,  maxEasting;
};

struct SurveyPoint
{
    double northing  = 0.0;
    double easting   = 0.0;
    double elevation = 0.0;
    SurveySource source = SurveySource::TopoSurvey;
    std::optional<Station> station;
    std::string description;
};

struct StationPair
{
    SurveyPoint a;
    SurveyPoint b;
};

/**
 * \brief Survey summary, always recomputed from the raw terrain samples.
 */
struct SurveyStatistics
{
    std::size_t surveyPoints = 0;
    double minElevation = 0.0;
    double maxElevation = 0.0;
    double relief       = 0.0;
    PlaneBounds bounds{};   ///< planar extent of the terrain samples
};

/*****************************************************************************
 * PointSet
 ****************************************************************************/
class PointSet
{
public:
    PointSet() = default;
    explicit PointSet(std::vector<SurveyPoint> points);

    const std::vector<SurveyPoint> &points() const { return points_; }
    bool empty() const { return points_.empty(); }

    /// topo_survey points in input order, as (northing, easting, elevation).
    std::vector<Point3D> terrainSamples() const;

    /// water_dist points in input order.
    std::vector<SurveyPoint> waterDistPoints() const;

    /**
     * \brief Station A and station B of the alignment.
     * \throws InvalidStationsError unless there are exactly two water_dist
     *         points labelled A and B.
     */
    StationPair alignmentStations() const;

    /// \throws EmptyInputError when there are no terrain samples.
    SurveyStatistics statistics() const;

    /// Hash over the terrain samples; identity key for memoized grids.
    std::size_t fingerprint() const;

private:
    std::vector<SurveyPoint> points_;
};

/*****************************************************************************
 * Reading
 ****************************************************************************/
std::optional<SurveySource> parseSurveySource(const std::string &tag);
std::optional<Station> parseStation(const std::string &tag);
std::string toString(SurveySource source);
std::string toString(Station station);

/**
 * \brief Parse survey points from a stream. Malformed lines are skipped and
 *        counted in \p skippedLines.
 */
PointSet readSurveyStream(std::istream &in, std::size_t &skippedLines);

/// \throws TerrainError if the file cannot be opened.
PointSet readSurveyFile(const std::string &fileName, std::size_t &skippedLines);

} // namespace topoalign

#endif // TOPOALIGN_POINT_SET_HPP
