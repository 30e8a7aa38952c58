#include "topoalign/point_set.hpp"

#include "topoalign/errors.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <limits>
#include <sstream>
#include <utility>

namespace topoalign
{

static void hashCombine(std::size_t &seed, std::size_t v)
{
    seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

std::size_t Point3DHash::operator()(const Point3D &p) const
{
    std::size_t seed = 0;
    hashCombine(seed, std::hash<double>{}(p.x));
    hashCombine(seed, std::hash<double>{}(p.y));
    hashCombine(seed, std::hash<double>{}(p.z));
    return seed;
}

/*****************************************************************************
 * PointSet
 ****************************************************************************/
PointSet::PointSet(std::vector<SurveyPoint> points)
    : points_(std::move(points))
{
}

std::vector<Point3D> PointSet::terrainSamples() const
{
    std::vector<Point3D> samples;
    samples.reserve(points_.size());
    for (const auto &p : points_)
    {
        if (p.source == SurveySource::TopoSurvey)
            samples.push_back({p.northing, p.easting, p.elevation});
    }
    return samples;
}

std::vector<SurveyPoint> PointSet::waterDistPoints() const
{
    std::vector<SurveyPoint> stations;
    for (const auto &p : points_)
    {
        if (p.source == SurveySource::WaterDist)
            stations.push_back(p);
    }
    return stations;
}

StationPair PointSet::alignmentStations() const
{
    const auto water = waterDistPoints();
    if (water.size() != 2)
    {
        std::ostringstream msg;
        msg << "expected exactly two water_dist stations, found " << water.size();
        throw InvalidStationsError(msg.str());
    }

    const SurveyPoint *a = nullptr;
    const SurveyPoint *b = nullptr;
    for (const auto &p : water)
    {
        if (!p.station) continue;
        if (*p.station == Station::A) a = &p;
        if (*p.station == Station::B) b = &p;
    }
    if (a == nullptr || b == nullptr)
        throw InvalidStationsError("water_dist stations must be labelled A and B");

    return {*a, *b};
}

SurveyStatistics PointSet::statistics() const
{
    SurveyStatistics stats;
    stats.minElevation = std::numeric_limits<double>::max();
    stats.maxElevation = -std::numeric_limits<double>::max();
    stats.bounds = {std::numeric_limits<double>::max(), -std::numeric_limits<double>::max(),
                    std::numeric_limits<double>::max(), -std::numeric_limits<double>::max()};

    for (const auto &p : points_)
    {
        if (p.source != SurveySource::TopoSurvey) continue;
        stats.surveyPoints++;
        stats.minElevation = std::min(stats.minElevation, p.elevation);
        stats.maxElevation = std::max(stats.maxElevation, p.elevation);
        stats.bounds.minNorthing = std::min(stats.bounds.minNorthing, p.northing);
        stats.bounds.maxNorthing = std::max(stats.bounds.maxNorthing, p.northing);
        stats.bounds.minEasting  = std::min(stats.bounds.minEasting, p.easting);
        stats.bounds.maxEasting  = std::max(stats.bounds.maxEasting, p.easting);
    }
    if (stats.surveyPoints == 0)
        throw EmptyInputError("no topo_survey points in survey");

    stats.relief = stats.maxElevation - stats.minElevation;
    return stats;
}

std::size_t PointSet::fingerprint() const
{
    std::size_t seed = 0;
    Point3DHash hasher;
    for (const auto &p : terrainSamples())
        hashCombine(seed, hasher(p));
    return seed;
}

/*****************************************************************************
 * Tags
 ****************************************************************************/
std::optional<SurveySource> parseSurveySource(const std::string &tag)
{
    if (tag == "topo_survey") return SurveySource::TopoSurvey;
    if (tag == "water_dist")  return SurveySource::WaterDist;
    return std::nullopt;
}

std::optional<Station> parseStation(const std::string &tag)
{
    if (tag == "A") return Station::A;
    if (tag == "B") return Station::B;
    return std::nullopt;
}

std::string toString(SurveySource source)
{
    return source == SurveySource::WaterDist ? "water_dist" : "topo_survey";
}

std::string toString(Station station)
{
    return station == Station::A ? "A" : "B";
}

/*****************************************************************************
 * Reading
 ****************************************************************************/
static bool parseSurveyLine(const std::string &rawLine, SurveyPoint &p)
{
    std::string line = rawLine;
    std::replace(line.begin(), line.end(), ',', ' ');
    std::istringstream iss(line);

    if (!(iss >> p.northing >> p.easting >> p.elevation))
        return false;

    std::string tag;
    if (iss >> tag)
    {
        auto source = parseSurveySource(tag);
        if (!source) return false;
        p.source = *source;
    }
    if (iss >> tag && tag != "-")
    {
        auto station = parseStation(tag);
        if (!station) return false;
        p.station = station;
    }

    std::getline(iss >> std::ws, p.description);
    while (!p.description.empty() &&
           (p.description.back() == ' ' || p.description.back() == '\r'))
    {
        p.description.pop_back();
    }
    return true;
}

PointSet readSurveyStream(std::istream &in, std::size_t &skippedLines)
{
    skippedLines = 0;
    std::vector<SurveyPoint> points;

    std::string line;
    while (std::getline(in, line))
    {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        SurveyPoint p;
        if (parseSurveyLine(line, p))
            points.push_back(std::move(p));
        else
            skippedLines++;
    }
    return PointSet(std::move(points));
}

PointSet readSurveyFile(const std::string &fileName, std::size_t &skippedLines)
{
    std::ifstream inFile(fileName);
    if (!inFile.is_open())
        throw TerrainError("Cannot open file " + fileName);
    return readSurveyStream(inFile, skippedLines);
}

} // namespace topoalign
