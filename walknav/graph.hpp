#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "nlohmann/json.hpp"
#include "geo.hpp"

enum class Direction {
    Both,
    Forward,   // digitized order only
    Backward   // reverse of digitized order only
};

// One road feature. A multi-part polyline keeps each part separately.
struct RoadSegment {
    std::vector<std::vector<Coord>> parts;
    std::string name;
    Direction direction = Direction::Both;
};

struct Edge {
    int id;
    int u, v;
    double length;       // meters
    std::string road_name;
    bool oneway;
};

struct Node {
    int id;
    Coord pos;
    std::vector<int> out;  // edge ids leaving this node
};

struct CoordHash {
    size_t operator()(const Coord &c) const {
        size_t h1 = std::hash<double>()(c.lon);
        size_t h2 = std::hash<double>()(c.lat);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// Weighted directed road graph. Built once, then shared read-only.
class Graph {
public:
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    BoundingBox extent;

    // Throws DataError when no edge can be produced.
    void buildFromRoads(const std::vector<RoadSegment> &roads);

    // Node with exactly this coordinate, or -1.
    int findNode(const Coord &c) const;

    // Cheapest edge u -> v, or nullptr.
    const Edge *findEdge(int u, int v) const;

private:
    std::unordered_map<Coord, int, CoordHash> node_by_coord;

    int addNode(const Coord &c);
    void addEdge(int u, int v, double length, const std::string &road_name, bool oneway);
};

std::shared_ptr<const Graph> build_graph(const std::vector<RoadSegment> &roads);

// Already-parsed features: [{"name", "direction", "coordinates": [[[lon,lat],...], ...]}]
// "coordinates" may also be a single part [[lon,lat],...].
std::vector<RoadSegment> roads_from_json(const nlohmann::json &j);
