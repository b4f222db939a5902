#include "routing.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>
#include <queue>
#include <spdlog/spdlog.h>

SPResult dijkstra(const Graph &g, int source, int target) {
    SPResult res{false, 0.0, {}, {}};

    int n = static_cast<int>(g.nodes.size());
    if (source < 0 || source >= n || target < 0 || target >= n)
        return res;
    if (source == target) {
        res.possible = true;
        res.path = {source};
        return res;
    }

    const double INF = std::numeric_limits<double>::infinity();
    std::vector<double> dist(n, INF);
    std::vector<int> parent_edge(n, -1);
    dist[source] = 0.0;

    using P = std::pair<double, int>;
    std::priority_queue<P, std::vector<P>, std::greater<P>> pq;
    pq.push({0.0, source});

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();
        if (d > dist[u]) continue;
        if (u == target) break;

        for (int id : g.nodes[u].out) {
            const Edge &e = g.edges[id];
            if (dist[u] + e.length < dist[e.v]) {
                dist[e.v] = dist[u] + e.length;
                parent_edge[e.v] = id;
                pq.push({dist[e.v], e.v});
            }
        }
    }

    if (dist[target] == INF)
        return res;

    // reconstruct path
    for (int cur = target; cur != source;) {
        int id = parent_edge[cur];
        res.edges.push_back(id);
        res.path.push_back(cur);
        cur = g.edges[id].u;
    }
    res.path.push_back(source);
    std::reverse(res.path.begin(), res.path.end());
    std::reverse(res.edges.begin(), res.edges.end());

    res.possible = true;
    res.cost = dist[target];
    return res;
}

RoutingEngine::RoutingEngine(std::shared_ptr<const Graph> graph, const Config &cfg)
    : graph_(graph),
      snapper_(graph, cfg.snap),
      generator(cfg.instructions),
      walking_speed_mps(cfg.routing.walking_speed_mps) {}

// Rethrow a snapping failure naming the endpoint, keeping its kind.
[[noreturn]] static void rethrow_for_endpoint(const NavError &e, const char *label) {
    std::string msg = std::string(label) + " point: " + e.what();
    switch (e.kind()) {
        case ErrorKind::OutOfBounds:
            throw OutOfBoundsError(msg);
        case ErrorKind::TooFarFromRoad:
            throw TooFarFromRoadError(msg, static_cast<const TooFarFromRoadError &>(e).distance());
        default:
            throw InvalidInputError(msg);
    }
}

int RoutingEngine::snapEndpoint(const Coord &p, const char *label, int *edge_id) const {
    SnapResult s;
    try {
        s = snapper_.snap(p);
    } catch (const NavError &e) {
        rethrow_for_endpoint(e, label);
    }
    if (edge_id) *edge_id = s.edge_id;
    const Edge &e = graph_->edges[s.edge_id];
    return s.t <= 0.5 ? e.u : e.v;
}

Route RoutingEngine::calculateRoute(const Coord &start, const Coord &end) const {
    int start_edge = -1;
    int source = snapEndpoint(start, "Start", &start_edge);
    int target = snapEndpoint(end, "End");

    // both clicks resolve to one junction: already there
    if (source == target) {
        const Coord &pos = graph_->nodes[source].pos;
        Route route;
        route.path = {pos, pos};
        route.node_ids = {source};
        route.instructions = generator.arrivalOnly(pos, graph_->edges[start_edge].road_name).instructions;
        spdlog::info("[RoutingEngine] start and end snap to node {}, zero-length route", source);
        return route;
    }

    SPResult sp = dijkstra(*graph_, source, target);
    if (!sp.possible) {
        spdlog::warn("[RoutingEngine] no path between nodes {} and {}", source, target);
        throw NoPathError("No connected walking path found between these points");
    }

    Route route;
    route.node_ids = sp.path;
    route.edge_ids = sp.edges;

    RoutePath rp;
    rp.points.reserve(sp.path.size());
    for (int id : sp.path) rp.points.push_back(graph_->nodes[id].pos);
    for (int id : sp.edges) {
        const Edge &e = graph_->edges[id];
        rp.road_names.push_back(e.road_name);
        rp.lengths.push_back(e.length);
    }

    InstructionSet set = generator.generate(rp);
    route.path = std::move(rp.points);
    route.instructions = std::move(set.instructions);
    route.total_distance_m = set.total_distance_m;
    route.estimated_time_s = route.total_distance_m / walking_speed_mps;

    spdlog::info("[RoutingEngine] route: {} nodes, {:.0f} m, {} instructions",
                 route.path.size(), route.total_distance_m, route.instructions.size());
    return route;
}
