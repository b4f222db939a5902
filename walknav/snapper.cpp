#include "snapper.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

SpatialIndex::SpatialIndex(const Graph &g, double cell_size_deg) : cell_size(cell_size_deg) {
    for (const auto &e : g.edges) {
        const Coord &a = g.nodes[e.u].pos;
        const Coord &b = g.nodes[e.v].pos;

        int minX = cellOf(std::min(a.lon, b.lon));
        int maxX = cellOf(std::max(a.lon, b.lon));
        int minY = cellOf(std::min(a.lat, b.lat));
        int maxY = cellOf(std::max(a.lat, b.lat));

        for (int x = minX; x <= maxX; x++)
            for (int y = minY; y <= maxY; y++)
                cells[key(x, y)].push_back(e.id);
    }
    spdlog::debug("[SpatialIndex] {} edges in {} cells of {} deg", g.edges.size(), cells.size(), cell_size);
}

int SpatialIndex::cellOf(double v) const {
    return static_cast<int>(std::floor(v / cell_size));
}

std::vector<int> SpatialIndex::candidates(const Coord &center, double radius_m) const {
    BoundingBox box = BoundingBox{center.lon, center.lat, center.lon, center.lat}.padded(radius_m);

    int minX = cellOf(box.min_lon);
    int maxX = cellOf(box.max_lon);
    int minY = cellOf(box.min_lat);
    int maxY = cellOf(box.max_lat);

    std::vector<int> out;
    for (int x = minX; x <= maxX; x++) {
        for (int y = minY; y <= maxY; y++) {
            auto it = cells.find(key(x, y));
            if (it == cells.end()) continue;
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

Snapper::Snapper(std::shared_ptr<const Graph> g, const SnapConfig &cfg)
    : graph(std::move(g)),
      index(*graph, cfg.grid_cell_deg),
      max_snap_distance(cfg.max_snap_distance_m) {
    bounds_ = cfg.bounds ? *cfg.bounds : graph->extent.padded(cfg.max_snap_distance_m);
}

SnapResult Snapper::snap(const Coord &p) const {
    return snap(p, max_snap_distance);
}

SnapResult Snapper::snap(const Coord &p, double max_distance_m) const {
    if (!is_valid_coord(p)) {
        throw InvalidInputError("Coordinates are not a valid longitude/latitude pair");
    }
    if (!bounds_.contains(p)) {
        throw OutOfBoundsError("This location is outside the navigable area");
    }

    SnapResult best{p, std::numeric_limits<double>::infinity(), -1, 0.0};

    // a few meters of slack so grid rounding never hides an edge at the threshold
    for (int id : index.candidates(p, max_distance_m + 5.0)) {
        const Edge &e = graph->edges[id];
        double t = 0.0;
        Coord proj = project_onto_segment(p, graph->nodes[e.u].pos, graph->nodes[e.v].pos, &t);
        double d = haversine_distance(p, proj);
        if (d < best.distance) {
            best = SnapResult{proj, d, id, t};
        }
    }

    if (best.edge_id < 0 || best.distance > max_distance_m) {
        throw TooFarFromRoadError("This location is too far from any road (more than " +
                                  format_distance(max_distance_m) + " away)", best.distance);
    }
    return best;
}
