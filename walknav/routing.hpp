#pragma once
#include <memory>
#include <vector>
#include "config.hpp"
#include "graph.hpp"
#include "instructions.hpp"
#include "snapper.hpp"

struct SPResult {
    bool possible;
    double cost;
    std::vector<int> path;    // node ids
    std::vector<int> edges;   // edge ids, path.size() - 1 of them
};

// Dijkstra over edge length; oneway edges are only followed u -> v.
SPResult dijkstra(const Graph &g, int source, int target);

struct Route {
    std::vector<Coord> path;
    std::vector<int> node_ids;
    std::vector<int> edge_ids;
    std::vector<Instruction> instructions;
    double total_distance_m = 0.0;
    double estimated_time_s = 0.0;
};

// Stateless apart from the shared graph; calculateRoute may run concurrently.
class RoutingEngine {
public:
    RoutingEngine(std::shared_ptr<const Graph> graph, const Config &cfg);

    Route calculateRoute(const Coord &start, const Coord &end) const;

    const Graph &graph() const { return *graph_; }
    const Snapper &snapper() const { return snapper_; }

private:
    std::shared_ptr<const Graph> graph_;
    Snapper snapper_;
    InstructionGenerator generator;
    double walking_speed_mps;

    // Node to route from, and the snapped edge it was taken from.
    int snapEndpoint(const Coord &p, const char *label, int *edge_id = nullptr) const;
};
