#include "route_query.hpp"
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

static std::string capitalized(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

static double parse_number(const std::string &text, const std::string &label) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        while (used < text.size() && std::isspace(static_cast<unsigned char>(text[used]))) used++;
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::logic_error &) {
        throw InvalidInputError("Invalid " + label + " coordinate format");
    }
}

Coord parse_coord(const json &value, const std::string &label) {
    if (value.is_null() || (value.is_string() && value.get<std::string>().empty())) {
        throw InvalidInputError("Missing " + label + " coordinates");
    }

    Coord c;
    if (value.is_array()) {
        if (value.size() != 2 || !value[0].is_number() || !value[1].is_number())
            throw InvalidInputError(capitalized(label) + " must contain exactly two numbers");
        c = Coord{value[0].get<double>(), value[1].get<double>()};
    } else if (value.is_string()) {
        std::string s = value;
        size_t comma = s.find(',');
        if (comma == std::string::npos || s.find(',', comma + 1) != std::string::npos)
            throw InvalidInputError(capitalized(label) + " must contain exactly two comma-separated values");
        c = Coord{parse_number(s.substr(0, comma), label), parse_number(s.substr(comma + 1), label)};
    } else {
        throw InvalidInputError("Invalid " + label + " coordinate format");
    }

    if (!is_valid_coord(c)) {
        throw InvalidInputError("Invalid " + label + " coordinates");
    }
    return c;
}

json route_to_json(const Route &route) {
    json coords = json::array();
    for (const auto &p : route.path) coords.push_back({p.lon, p.lat});

    json directions = json::array();
    json anchors = json::array();
    for (const auto &ins : route.instructions) {
        directions.push_back({{"text", ins.text}, {"location", {ins.location.lon, ins.location.lat}}});
        anchors.push_back(ins.path_index);
    }

    json out;
    out["route"] = {
        {"type", "Feature"},
        {"geometry", {{"type", "LineString"}, {"coordinates", coords}}},
        {"properties", json::object()}
    };
    out["directions"] = directions;
    out["instruction_coords"] = anchors;
    out["total_distance_m"] = route.total_distance_m;
    out["estimated_time_seconds"] = route.estimated_time_s;
    return out;
}

json error_to_json(ErrorKind kind, const std::string &message) {
    return {{"error", {{"kind", error_kind_name(kind)}, {"message", message}}}};
}

json run_query(const std::function<json()> &body) {
    try {
        return body();
    } catch (const NavError &e) {
        spdlog::warn("[RouteQuery] {}: {}", error_kind_name(e.kind()), e.what());
        return error_to_json(e.kind(), e.what());
    } catch (const json::exception &e) {
        spdlog::warn("[RouteQuery] malformed request: {}", e.what());
        return error_to_json(ErrorKind::InvalidInput, "Malformed request");
    } catch (const std::exception &e) {
        spdlog::error("[RouteQuery] unexpected failure: {}", e.what());
        return error_to_json(ErrorKind::InvalidInput, "The request could not be processed");
    }
}

json handle_route_query(const RoutingEngine &engine, const json &query) {
    return run_query([&] {
        Coord start = parse_coord(query.contains("start") ? query["start"] : json(), "start");
        Coord end = parse_coord(query.contains("end") ? query["end"] : json(), "end");

        spdlog::info("[RouteQuery] route from ({}, {}) to ({}, {})", start.lon, start.lat, end.lon, end.lat);
        return route_to_json(engine.calculateRoute(start, end));
    });
}
