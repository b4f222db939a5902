#pragma once
#include <string>
#include <vector>
#include "geo.hpp"
#include "graph.hpp"

// Synthetic fixtures live on the equator, where one degree is the same
// distance along both axes and offsets in meters convert exactly.
constexpr double METERS_PER_DEG = EARTH_RADIUS_M * 3.14159265358979323846 / 180.0;

inline Coord at(double east_m, double north_m) {
    return Coord{east_m / METERS_PER_DEG, north_m / METERS_PER_DEG};
}

// Straight polyline from a to b with a vertex every step_m meters.
inline std::vector<Coord> line(Coord a, Coord b, double step_m) {
    int n = static_cast<int>(haversine_distance(a, b) / step_m + 0.5);
    if (n < 1) n = 1;
    std::vector<Coord> pts;
    for (int i = 0; i <= n; i++) {
        double f = static_cast<double>(i) / n;
        pts.push_back(Coord{a.lon + f * (b.lon - a.lon), a.lat + f * (b.lat - a.lat)});
    }
    return pts;
}

inline RoadSegment road(const std::string &name, std::vector<Coord> pts, Direction dir = Direction::Both) {
    RoadSegment r;
    r.name = name;
    r.parts.push_back(std::move(pts));
    r.direction = dir;
    return r;
}
