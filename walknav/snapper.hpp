#pragma once
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "graph.hpp"

struct SnapResult {
    Coord point;        // projection on the edge
    double distance;    // meters from the query point
    int edge_id;
    double t;           // position along the edge, 0 = u, 1 = v
};

// Uniform lon/lat grid over edge bounding boxes.
class SpatialIndex {
public:
    SpatialIndex(const Graph &g, double cell_size_deg);

    // Edge ids whose cells intersect the window, ascending and unique.
    std::vector<int> candidates(const Coord &center, double radius_m) const;

private:
    double cell_size;
    std::unordered_map<uint64_t, std::vector<int>> cells;

    int cellOf(double v) const;
    // cell indices are negative west of 0 deg lon and south of the equator
    static uint64_t key(int x, int y) {
        return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) | static_cast<uint32_t>(y);
    }
};

// Projects arbitrary coordinates onto the nearest graph edge.
class Snapper {
public:
    Snapper(std::shared_ptr<const Graph> graph, const SnapConfig &cfg);

    // Uses the configured maximum snap distance.
    SnapResult snap(const Coord &p) const;
    SnapResult snap(const Coord &p, double max_distance_m) const;

    const BoundingBox &bounds() const { return bounds_; }
    double maxSnapDistance() const { return max_snap_distance; }

private:
    std::shared_ptr<const Graph> graph;
    SpatialIndex index;
    BoundingBox bounds_;
    double max_snap_distance;
};
