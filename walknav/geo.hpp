#pragma once
#include <string>

constexpr double EARTH_RADIUS_M = 6371000.0;

// Coordinates are stored lon-first to match GeoJSON ordering.
struct Coord {
    double lon = 0.0;
    double lat = 0.0;
};

inline bool operator==(const Coord &a, const Coord &b) { return a.lon == b.lon && a.lat == b.lat; }
inline bool operator!=(const Coord &a, const Coord &b) { return !(a == b); }

struct BoundingBox {
    double min_lon = 0.0;
    double min_lat = 0.0;
    double max_lon = 0.0;
    double max_lat = 0.0;

    bool contains(const Coord &p) const {
        return p.lon >= min_lon && p.lon <= max_lon && p.lat >= min_lat && p.lat <= max_lat;
    }

    // Grow by a margin given in meters.
    BoundingBox padded(double meters) const;
};

// Great-circle (haversine) distance in meters.
double haversine_distance(const Coord &p1, const Coord &p2);

// Forward azimuth from p1 towards p2, degrees in [0, 360).
double bearing(const Coord &p1, const Coord &p2);

// One of: north, northeast, east, southeast, south, southwest, west, northwest.
std::string bearing_to_cardinal(double bearing_deg);

// Signed difference in (-180, 180]. Positive is a clockwise (right) turn.
double turn_angle(double bearing_in, double bearing_out);

bool is_valid_coord(const Coord &p);

// "45 meters" / "1.2 kilometers"
std::string format_distance(double meters);

// Closest point to p on segment [a, b] using a local equirectangular frame.
// t receives the clamped segment parameter in [0, 1].
Coord project_onto_segment(const Coord &p, const Coord &a, const Coord &b, double *t = nullptr);
