#pragma once
#include <functional>
#include <string>
#include "nlohmann/json.hpp"
#include "errors.hpp"
#include "routing.hpp"

// Accepts [lon, lat] or "lon,lat". Throws InvalidInputError.
Coord parse_coord(const nlohmann::json &value, const std::string &label);

// {route, directions, instruction_coords, total_distance_m, estimated_time_seconds}
nlohmann::json route_to_json(const Route &route);

// {error: {kind, message}}
nlohmann::json error_to_json(ErrorKind kind, const std::string &message);

// Runs one request body. NavError keeps its kind; anything else derived from
// std::exception becomes InvalidInput.
nlohmann::json run_query(const std::function<nlohmann::json()> &body);

// Route request {start, end} -> success or failure document.
nlohmann::json handle_route_query(const RoutingEngine &engine, const nlohmann::json &query);
