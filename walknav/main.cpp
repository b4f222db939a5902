#include <iostream>
#include <fstream>
#include <chrono>
#include <memory>
#include <vector>
#include <string>
#include <spdlog/spdlog.h>
#include "nlohmann/json.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "navigation.hpp"
#include "route_query.hpp"
#include "routing.hpp"

using json = nlohmann::json;

static json event_to_json(const SessionEvent &ev) {
    json j;
    switch (ev.type) {
        case SessionEventType::Announcement:
            j = {{"type", "announcement"}, {"text", ev.text}, {"priority", ev.priority}};
            break;
        case SessionEventType::StateChanged:
            j = {{"type", "state"}, {"state", nav_state_name(ev.state)}};
            break;
        case SessionEventType::Progress:
            j = {{"type", "progress"},
                 {"current_instruction", ev.progress.current_instruction},
                 {"distance_traveled_m", ev.progress.distance_traveled_m},
                 {"distance_remaining_m", ev.progress.distance_remaining_m},
                 {"off_route", ev.progress.off_route}};
            if (ev.progress.on_route_position) {
                j["on_route_position"] = {ev.progress.on_route_position->lon, ev.progress.on_route_position->lat};
            }
            break;
        case SessionEventType::Status:
            j = {{"type", "status"}, {"text", ev.text}};
            break;
        case SessionEventType::Arrived:
            j = {{"type", "arrived"}};
            break;
        case SessionEventType::Cancelled:
            j = {{"type", "cancelled"}};
            break;
        case SessionEventType::Finished:
            j = {{"type", "finished"}};
            break;
    }
    return j;
}

static PositionErrorKind parse_position_error(const std::string &s) {
    if (s == "permission_denied") return PositionErrorKind::PermissionDenied;
    if (s == "unavailable") return PositionErrorKind::Unavailable;
    if (s == "timeout") return PositionErrorKind::Timeout;
    return PositionErrorKind::Other;
}

// Replays a scripted position stream against a fresh state machine.
static json replay_navigation(const RoutingEngine &engine, const Config &cfg, const json &query) {
    Route route = engine.calculateRoute(parse_coord(query.at("start"), "start"),
                                        parse_coord(query.at("end"), "end"));

    NavigationStateMachine machine(cfg.guidance);
    json events = json::array();
    auto record = [&](const std::vector<SessionEvent> &evs) {
        for (const auto &ev : evs) events.push_back(event_to_json(ev));
    };

    record(machine.start(route));
    for (const auto &jp : query.value("positions", json::array())) {
        if (jp.contains("error")) {
            record(machine.onPositionError({parse_position_error(jp["error"].get<std::string>()), jp.value("message", "")}));
            continue;
        }
        double accuracy = jp.value("accuracyMeters", jp.value("accuracy", 10.0));
        PositionUpdate u{jp.at("lat").get<double>(), jp.at("lon").get<double>(), accuracy, std::nullopt};
        if (jp.contains("headingDegrees")) u.heading_deg = jp["headingDegrees"].get<double>();
        else if (jp.contains("heading")) u.heading_deg = jp["heading"].get<double>();
        record(machine.onPositionUpdate(u));
        if (machine.state() == NavState::Arrived) record(machine.finish());
    }
    if (query.value("cancel", false)) record(machine.clear());

    json result = route_to_json(route);
    result["events"] = events;
    result["final_state"] = nav_state_name(machine.state());
    return result;
}

json process_query(const RoutingEngine &engine, const Config &cfg, const json &query) {
    json result = run_query([&]() -> json {
        std::string type = query.value("type", "route");

        if (type == "route") {
            return handle_route_query(engine, query);

        } else if (type == "navigate") {
            return replay_navigation(engine, cfg, query);

        } else if (type == "snap") {
            SnapResult s = engine.snapper().snap(parse_coord(query.at("point"), "point"));
            json out;
            out["point"] = {s.point.lon, s.point.lat};
            out["distance_m"] = s.distance;
            out["road_name"] = engine.graph().edges[s.edge_id].road_name;
            return out;
        }
        return error_to_json(ErrorKind::InvalidInput, "Unknown query type '" + type + "'");
    });

    if (query.is_object() && query.contains("id")) result["id"] = query["id"];
    return result;
}

static bool read_json(const std::string &path, json &out) {
    std::ifstream fin(path);
    if (!fin.is_open()) {
        spdlog::error("Failed to open {}", path);
        return false;
    }
    try {
        fin >> out;
    } catch (const json::exception &e) {
        spdlog::error("Error parsing {}: {}", path, e.what());
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc != 4 && argc != 5) {
        std::cerr << "Usage: " << argv[0] << " <roads.json> <queries.json> <output.json> [config.json]" << std::endl;
        return 1;
    }

    Config cfg;
    try {
        if (argc == 5) cfg = Config::fromFile(argv[4]);
    } catch (const NavError &e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    json roads_json;
    if (!read_json(argv[1], roads_json)) return 1;

    std::shared_ptr<const Graph> graph;
    try {
        graph = build_graph(roads_from_json(roads_json));
    } catch (const DataError &e) {
        spdlog::error("Cannot build road graph: {}", e.what());
        return 1;
    }

    RoutingEngine engine(graph, cfg);

    json queries_json;
    if (!read_json(argv[2], queries_json)) return 1;

    json meta = queries_json.value("meta", json::object());
    std::vector<json> results;

    for (const auto &query : queries_json.value("events", json::array())) {
        auto start_time = std::chrono::high_resolution_clock::now();

        json result = process_query(engine, cfg, query);

        auto end_time = std::chrono::high_resolution_clock::now();
        result["processing_time"] = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        results.push_back(result);
    }

    std::ofstream output_file(argv[3]);
    if (!output_file.is_open()) {
        spdlog::error("Failed to open {} for writing", argv[3]);
        return 1;
    }

    json output;
    output["meta"] = meta;
    output["results"] = results;
    output_file << output.dump(4) << std::endl;

    spdlog::info("Processed {} queries", results.size());
    return 0;
}
