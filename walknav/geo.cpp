#include "geo.hpp"
#include <cmath>
#include <algorithm>
#include <sstream>
#include <iomanip>

static constexpr double PI = 3.14159265358979323846;
static constexpr double DEG2RAD = PI / 180.0;
static constexpr double RAD2DEG = 180.0 / PI;

double haversine_distance(const Coord &p1, const Coord &p2) {
    double lat1 = p1.lat * DEG2RAD;
    double lat2 = p2.lat * DEG2RAD;
    double dLat = (p2.lat - p1.lat) * DEG2RAD;
    double dLon = (p2.lon - p1.lon) * DEG2RAD;

    double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
               std::cos(lat1) * std::cos(lat2) *
               std::sin(dLon / 2) * std::sin(dLon / 2);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return EARTH_RADIUS_M * c;
}

double bearing(const Coord &p1, const Coord &p2) {
    double lat1 = p1.lat * DEG2RAD;
    double lat2 = p2.lat * DEG2RAD;
    double dLon = (p2.lon - p1.lon) * DEG2RAD;

    double y = std::sin(dLon) * std::cos(lat2);
    double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dLon);
    double b = std::fmod(std::atan2(y, x) * RAD2DEG + 360.0, 360.0);
    return b >= 360.0 ? 0.0 : b;
}

std::string bearing_to_cardinal(double bearing_deg) {
    static const char *LABELS[8] = {
        "north", "northeast", "east", "southeast",
        "south", "southwest", "west", "northwest"
    };
    double b = std::fmod(bearing_deg, 360.0);
    if (b < 0) b += 360.0;
    int sector = static_cast<int>(std::floor((b + 22.5) / 45.0)) % 8;
    return LABELS[sector];
}

double turn_angle(double bearing_in, double bearing_out) {
    double a = std::fmod(bearing_out - bearing_in + 180.0, 360.0);
    if (a < 0) a += 360.0;
    a -= 180.0;
    // fold the open end so the range is (-180, 180]
    if (a <= -180.0) a = 180.0;
    return a;
}

BoundingBox BoundingBox::padded(double meters) const {
    double dLat = meters / EARTH_RADIUS_M * RAD2DEG;
    double midLat = (min_lat + max_lat) / 2.0;
    double k = std::max(std::cos(midLat * DEG2RAD), 1e-6);
    double dLon = dLat / k;
    return BoundingBox{min_lon - dLon, min_lat - dLat, max_lon + dLon, max_lat + dLat};
}

bool is_valid_coord(const Coord &p) {
    return std::isfinite(p.lon) && std::isfinite(p.lat) &&
           p.lon >= -180.0 && p.lon <= 180.0 &&
           p.lat >= -90.0 && p.lat <= 90.0;
}

std::string format_distance(double meters) {
    std::ostringstream out;
    if (meters >= 1000.0) {
        out << std::fixed << std::setprecision(1) << meters / 1000.0 << " kilometers";
    } else {
        out << std::lround(meters) << " meters";
    }
    return out.str();
}

Coord project_onto_segment(const Coord &p, const Coord &a, const Coord &b, double *t_out) {
    double k = std::cos(a.lat * DEG2RAD);
    double dx = (b.lon - a.lon) * k;
    double dy = b.lat - a.lat;
    double len2 = dx * dx + dy * dy;

    if (len2 < 1e-20) {
        if (t_out) *t_out = 0.0;
        return a;
    }

    double t = ((p.lon - a.lon) * k * dx + (p.lat - a.lat) * dy) / len2;
    t = std::max(0.0, std::min(1.0, t));
    if (t_out) *t_out = t;

    if (t == 0.0) return a;
    if (t == 1.0) return b;
    return Coord{a.lon + t * (b.lon - a.lon), a.lat + t * (b.lat - a.lat)};
}
