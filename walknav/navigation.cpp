#include "navigation.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

static const char *OFF_ROUTE_TEXT = "You are off route. Please return to the marked path.";
static const char *BACK_ON_ROUTE_TEXT = "Back on route.";
static const char *ARRIVED_TEXT = "You have arrived at your destination.";

const char *nav_state_name(NavState s) {
    switch (s) {
        case NavState::Idle: return "idle";
        case NavState::Guiding: return "guiding";
        case NavState::OffRoute: return "off_route";
        case NavState::Arrived: return "arrived";
    }
    return "idle";
}

double off_route_threshold(double accuracy_m, const GuidanceConfig &cfg) {
    return accuracy_m > cfg.relaxed_accuracy_m ? cfg.off_route_relaxed_m : cfg.off_route_m;
}

double tracking_snap_threshold(double accuracy_m, const GuidanceConfig &cfg) {
    return std::clamp(accuracy_m, cfg.tracking_snap_min_m, cfg.tracking_snap_max_m);
}

bool is_reliable_fix(double accuracy_m, const GuidanceConfig &cfg) {
    return accuracy_m <= cfg.poor_accuracy_m;
}

bool can_lock_proximity(double dist_to_route_m, double accuracy_m, const GuidanceConfig &cfg) {
    return dist_to_route_m <= cfg.proximity_lock_m && is_reliable_fix(accuracy_m, cfg);
}

bool in_advance_warning_band(double dist_m, const GuidanceConfig &cfg) {
    return dist_m > cfg.advance_warning_near_m && dist_m <= cfg.advance_warning_far_m;
}

RouteGeometry::RouteGeometry(const std::vector<Coord> &path) : path(path) {
    cumulative.reserve(path.size());
    double acc = 0.0;
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) acc += haversine_distance(path[i - 1], path[i]);
        cumulative.push_back(acc);
    }
}

double RouteGeometry::minVertexDistance(const Coord &p) const {
    double best = std::numeric_limits<double>::infinity();
    for (const auto &v : path) best = std::min(best, haversine_distance(p, v));
    return best;
}

RouteProjection RouteGeometry::project(const Coord &p) const {
    RouteProjection best{p, std::numeric_limits<double>::infinity(), 0.0};
    if (path.size() == 1) {
        return RouteProjection{path[0], haversine_distance(p, path[0]), 0.0};
    }
    for (size_t i = 0; i + 1 < path.size(); i++) {
        Coord q = project_onto_segment(p, path[i], path[i + 1]);
        double d = haversine_distance(p, q);
        if (d < best.distance) {
            best = RouteProjection{q, d, cumulative[i] + haversine_distance(path[i], q)};
        }
    }
    return best;
}

SessionEvent SessionEvent::announcement(const std::string &text, bool priority, bool force) {
    SessionEvent e{SessionEventType::Announcement};
    e.text = text;
    e.priority = priority;
    e.force = force;
    return e;
}

SessionEvent SessionEvent::stateChanged(NavState s) {
    SessionEvent e{SessionEventType::StateChanged};
    e.state = s;
    return e;
}

SessionEvent SessionEvent::status(const std::string &text) {
    SessionEvent e{SessionEventType::Status};
    e.text = text;
    return e;
}

SessionEvent SessionEvent::terminal(SessionEventType type) {
    return SessionEvent{type};
}

NavigationStateMachine::NavigationStateMachine(const GuidanceConfig &cfg) : cfg(cfg) {}

void NavigationStateMachine::announce(std::vector<SessionEvent> &out, const std::string &text,
                                      bool priority, bool force) {
    session_->last_spoken_text = text;
    out.push_back(SessionEvent::announcement(text, priority, force));
}

void NavigationStateMachine::transition(std::vector<SessionEvent> &out, NavState next) {
    spdlog::debug("[Navigation] {} -> {}", nav_state_name(state_), nav_state_name(next));
    state_ = next;
    out.push_back(SessionEvent::stateChanged(next));
}

std::vector<SessionEvent> NavigationStateMachine::start(const Route &route) {
    if (route.path.size() < 2 || route.instructions.empty()) {
        throw InvalidInputError("Cannot start guidance on an empty route");
    }

    std::vector<SessionEvent> out;
    if (session_) {
        spdlog::info("[Navigation] replacing active route");
    }

    session_ = NavigationSession{};
    session_->route = route;
    geometry.emplace(route.path);

    transition(out, NavState::Guiding);
    announce(out, "Route found! " + format_distance(route.total_distance_m) + " total.", true, true);
    announce(out, route.instructions.front().text, false, false);
    return out;
}

std::vector<SessionEvent> NavigationStateMachine::onPositionUpdate(const PositionUpdate &u) {
    std::vector<SessionEvent> out;
    if (state_ == NavState::Idle || state_ == NavState::Arrived) return out;

    Coord p{u.lon, u.lat};
    if (!is_valid_coord(p) || !std::isfinite(u.accuracy_m) || u.accuracy_m < 0) {
        spdlog::warn("[Navigation] discarding malformed position ({}, {}) accuracy {}",
                     u.lat, u.lon, u.accuracy_m);
        return out;
    }

    NavigationSession &s = *session_;
    const auto &instructions = s.route.instructions;
    double acc = u.accuracy_m;

    double minDist = geometry->minVertexDistance(p);
    RouteProjection proj = geometry->project(p);
    s.distance_traveled = proj.along;

    if (!s.has_entered_proximity && can_lock_proximity(minDist, acc, cfg)) {
        s.has_entered_proximity = true;
        spdlog::info("[Navigation] entered route proximity at {:.1f} m", minDist);
        out.push_back(SessionEvent::status("Navigation tracking active"));
    }

    // poor fixes still update progress but never move between on/off route
    if (s.has_entered_proximity && is_reliable_fix(acc, cfg)) {
        double threshold = off_route_threshold(acc, cfg);
        if (minDist > threshold && state_ == NavState::Guiding) {
            s.is_off_route = true;
            transition(out, NavState::OffRoute);
            announce(out, OFF_ROUTE_TEXT, true, true);
        } else if (minDist <= threshold && state_ == NavState::OffRoute) {
            s.is_off_route = false;
            transition(out, NavState::Guiding);
            announce(out, BACK_ON_ROUTE_TEXT, true, true);
        }
    }

    if (state_ == NavState::Guiding) {
        size_t next = s.current_instruction_index + 1;
        if (next < instructions.size()) {
            double distToNext = haversine_distance(p, instructions[next].location);

            if (in_advance_warning_band(distToNext, cfg) && !s.advance_warning_given) {
                announce(out, "In " + format_distance(distToNext) + ", " + instructions[next].text, true, false);
                s.advance_warning_given = true;
            }

            // a fix may pass an anchor without ever coming within advance_m;
            // the projection still shows the walker is beyond it
            bool tracked = s.has_entered_proximity && is_reliable_fix(acc, cfg);
            size_t reached = s.current_instruction_index;
            if (distToNext < cfg.advance_m) reached = next;
            if (tracked) {
                while (reached + 1 < instructions.size() &&
                       geometry->distanceAt(instructions[reached + 1].path_index) <= proj.along) {
                    reached++;
                }
            }

            if (reached != s.current_instruction_index) {
                s.current_instruction_index = reached;
                s.advance_warning_given = false;
                announce(out, instructions[reached].text, true, true);
            }
        }
    }

    Progress prog;
    prog.current_instruction = s.current_instruction_index;
    prog.distance_traveled_m = s.distance_traveled;
    prog.distance_remaining_m = std::max(0.0, geometry->length() - s.distance_traveled);
    prog.distance_to_route_m = minDist;
    prog.off_route = s.is_off_route;
    if (proj.distance <= tracking_snap_threshold(acc, cfg)) prog.on_route_position = proj.point;

    SessionEvent pe{SessionEventType::Progress};
    pe.progress = prog;
    out.push_back(pe);

    if (s.current_instruction_index + 1 >= instructions.size() &&
        haversine_distance(p, s.route.path.back()) < cfg.arrival_m) {
        transition(out, NavState::Arrived);
        announce(out, ARRIVED_TEXT, true, true);
        out.push_back(SessionEvent::terminal(SessionEventType::Arrived));
        spdlog::info("[Navigation] arrived after {:.0f} m", s.distance_traveled);
    }
    return out;
}

std::vector<SessionEvent> NavigationStateMachine::onPositionError(const PositionError &error) {
    std::vector<SessionEvent> out;
    if (state_ == NavState::Idle) return out;

    std::string msg;
    switch (error.kind) {
        case PositionErrorKind::PermissionDenied:
            msg = "Location permission denied. Please enable location access.";
            break;
        case PositionErrorKind::Unavailable:
            msg = "Location unavailable. Please check your device settings.";
            break;
        case PositionErrorKind::Timeout:
            msg = "Location request timed out. Retrying...";
            break;
        case PositionErrorKind::Other:
            msg = "Location error: " + error.message;
            break;
    }
    spdlog::warn("[Navigation] position source: {}", msg);
    out.push_back(SessionEvent::status(msg));
    return out;
}

std::vector<SessionEvent> NavigationStateMachine::clear() {
    std::vector<SessionEvent> out;
    if (state_ == NavState::Idle) return out;

    session_.reset();
    geometry.reset();
    transition(out, NavState::Idle);
    out.push_back(SessionEvent::terminal(SessionEventType::Cancelled));
    spdlog::info("[Navigation] guidance cancelled");
    return out;
}

std::vector<SessionEvent> NavigationStateMachine::finish() {
    std::vector<SessionEvent> out;
    if (state_ != NavState::Arrived) return out;

    session_.reset();
    geometry.reset();
    transition(out, NavState::Idle);
    out.push_back(SessionEvent::terminal(SessionEventType::Finished));
    return out;
}

std::vector<SessionEvent> NavigationStateMachine::repeatCurrentInstruction() {
    std::vector<SessionEvent> out;
    if (state_ != NavState::Guiding && state_ != NavState::OffRoute) return out;

    const auto &ins = session_->route.instructions;
    announce(out, ins[session_->current_instruction_index].text, true, true);
    return out;
}
