#include "graph.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

static const char *UNNAMED_ROAD = "Unnamed Road";

int Graph::addNode(const Coord &c) {
    auto it = node_by_coord.find(c);
    if (it != node_by_coord.end()) return it->second;

    Node n;
    n.id = static_cast<int>(nodes.size());
    n.pos = c;
    nodes.push_back(n);
    node_by_coord[c] = n.id;

    if (nodes.size() == 1) {
        extent = BoundingBox{c.lon, c.lat, c.lon, c.lat};
    } else {
        extent.min_lon = std::min(extent.min_lon, c.lon);
        extent.min_lat = std::min(extent.min_lat, c.lat);
        extent.max_lon = std::max(extent.max_lon, c.lon);
        extent.max_lat = std::max(extent.max_lat, c.lat);
    }
    return n.id;
}

void Graph::addEdge(int u, int v, double length, const std::string &road_name, bool oneway) {
    Edge e;
    e.id = static_cast<int>(edges.size());
    e.u = u;
    e.v = v;
    e.length = length;
    e.road_name = road_name;
    e.oneway = oneway;
    nodes[u].out.push_back(e.id);
    edges.push_back(e);
}

void Graph::buildFromRoads(const std::vector<RoadSegment> &roads) {
    nodes.clear();
    edges.clear();
    node_by_coord.clear();
    extent = BoundingBox{};

    if (roads.empty()) {
        throw DataError("Road dataset is empty");
    }

    size_t skipped = 0;
    for (size_t r = 0; r < roads.size(); r++) {
        const RoadSegment &road = roads[r];
        const std::string name = road.name.empty() ? UNNAMED_ROAD : road.name;
        bool oneway = road.direction != Direction::Both;

        for (const auto &part : road.parts) {
            if (part.size() < 2) {
                spdlog::warn("[GraphBuilder] road #{} '{}' has a part with {} coordinate(s), skipped",
                             r, name, part.size());
                skipped++;
                continue;
            }
            if (!std::all_of(part.begin(), part.end(), is_valid_coord)) {
                spdlog::warn("[GraphBuilder] road #{} '{}' has invalid coordinates, part skipped", r, name);
                skipped++;
                continue;
            }

            for (size_t i = 0; i + 1 < part.size(); i++) {
                const Coord &p1 = part[i];
                const Coord &p2 = part[i + 1];
                double length = haversine_distance(p1, p2);
                int a = addNode(p1);
                int b = addNode(p2);
                if (a == b) continue;   // repeated vertex

                if (road.direction != Direction::Backward) addEdge(a, b, length, name, oneway);
                if (road.direction != Direction::Forward) addEdge(b, a, length, name, oneway);
            }
        }
    }

    if (edges.empty()) {
        throw DataError("Road dataset contains no usable road geometry");
    }

    spdlog::info("[GraphBuilder] built graph: {} nodes, {} edges ({} parts skipped)",
                 nodes.size(), edges.size(), skipped);
}

int Graph::findNode(const Coord &c) const {
    auto it = node_by_coord.find(c);
    return it == node_by_coord.end() ? -1 : it->second;
}

const Edge *Graph::findEdge(int u, int v) const {
    if (u < 0 || u >= static_cast<int>(nodes.size())) return nullptr;
    const Edge *best = nullptr;
    for (int id : nodes[u].out) {
        const Edge &e = edges[id];
        if (e.v == v && (!best || e.length < best->length)) best = &e;
    }
    return best;
}

std::shared_ptr<const Graph> build_graph(const std::vector<RoadSegment> &roads) {
    auto g = std::make_shared<Graph>();
    g->buildFromRoads(roads);
    return g;
}

static Direction parse_direction(const json &jf) {
    // accept either an explicit direction or an OSM-style oneway tag
    if (jf.contains("direction")) {
        std::string d = jf["direction"];
        if (d == "forward") return Direction::Forward;
        if (d == "backward") return Direction::Backward;
        if (d == "both" || d == "bidirectional") return Direction::Both;
        throw DataError("Unknown road direction '" + d + "'");
    }
    if (jf.contains("oneway")) {
        const auto &o = jf["oneway"];
        if (o.is_boolean()) return o.get<bool>() ? Direction::Forward : Direction::Both;
        if (o.is_string()) {
            std::string s = o;
            if (s == "yes" || s == "1" || s == "true") return Direction::Forward;
            if (s == "-1") return Direction::Backward;
        }
    }
    return Direction::Both;
}

static std::vector<Coord> parse_part(const json &jp) {
    std::vector<Coord> part;
    part.reserve(jp.size());
    for (const auto &pt : jp) {
        if (!pt.is_array() || pt.size() < 2) throw DataError("Malformed road coordinate");
        part.push_back(Coord{pt[0].get<double>(), pt[1].get<double>()});
    }
    return part;
}

static RoadSegment road_from_json(const json &jf) {
    RoadSegment road;
    road.name = jf.contains("name") && jf["name"].is_string() ? jf["name"].get<std::string>() : "";
    road.direction = parse_direction(jf);

    const auto &coords = jf.at("coordinates");
    // single part when the first element is itself a [lon, lat] pair
    bool single = !coords.empty() && coords[0].is_array() && !coords[0].empty() && coords[0][0].is_number();
    if (single) {
        road.parts.push_back(parse_part(coords));
    } else {
        for (const auto &jp : coords) road.parts.push_back(parse_part(jp));
    }
    return road;
}

std::vector<RoadSegment> roads_from_json(const json &j) {
    const json &features = j.is_object() && j.contains("features") ? j["features"] : j;
    if (!features.is_array()) throw DataError("Road dataset must be an array of features");

    std::vector<RoadSegment> roads;
    roads.reserve(features.size());

    try {
        for (const auto &jf : features) {
            roads.push_back(road_from_json(jf));
        }
    } catch (const json::exception &e) {
        throw DataError("Malformed road feature: " + std::string(e.what()));
    }
    return roads;
}
