#pragma once
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "routing.hpp"

enum class NavState { Idle, Guiding, OffRoute, Arrived };

const char *nav_state_name(NavState s);

struct PositionUpdate {
    double lat;
    double lon;
    double accuracy_m;
    std::optional<double> heading_deg;
};

enum class PositionErrorKind { PermissionDenied, Unavailable, Timeout, Other };

struct PositionError {
    PositionErrorKind kind;
    std::string message;
};

// Accuracy-dependent thresholds.
double off_route_threshold(double accuracy_m, const GuidanceConfig &cfg);
double tracking_snap_threshold(double accuracy_m, const GuidanceConfig &cfg);
bool is_reliable_fix(double accuracy_m, const GuidanceConfig &cfg);
bool can_lock_proximity(double dist_to_route_m, double accuracy_m, const GuidanceConfig &cfg);
bool in_advance_warning_band(double dist_m, const GuidanceConfig &cfg);

struct RouteProjection {
    Coord point;
    double distance;   // meters from the query position
    double along;      // arc length from the route start
};

// Cumulative-distance view of a route polyline.
class RouteGeometry {
public:
    explicit RouteGeometry(const std::vector<Coord> &path);

    double minVertexDistance(const Coord &p) const;
    RouteProjection project(const Coord &p) const;
    double length() const { return cumulative.empty() ? 0.0 : cumulative.back(); }
    double distanceAt(size_t index) const { return cumulative[index]; }

private:
    std::vector<Coord> path;
    std::vector<double> cumulative;
};

struct Progress {
    size_t current_instruction = 0;
    double distance_traveled_m = 0.0;
    double distance_remaining_m = 0.0;
    double distance_to_route_m = 0.0;
    bool off_route = false;
    std::optional<Coord> on_route_position;   // set when inside the tracking band
};

enum class SessionEventType {
    Announcement,
    StateChanged,
    Progress,
    Status,
    Arrived,
    Cancelled,
    Finished
};

struct SessionEvent {
    SessionEventType type;
    std::string text;          // Announcement, Status
    bool priority = false;
    bool force = false;
    NavState state = NavState::Idle;
    Progress progress;

    static SessionEvent announcement(const std::string &text, bool priority, bool force = false);
    static SessionEvent stateChanged(NavState s);
    static SessionEvent status(const std::string &text);
    static SessionEvent terminal(SessionEventType type);
};

struct NavigationSession {
    Route route;
    size_t current_instruction_index = 0;
    double distance_traveled = 0.0;
    bool is_off_route = false;
    bool advance_warning_given = false;
    std::string last_spoken_text;
    bool has_entered_proximity = false;
};

// Idle -> Guiding <-> OffRoute -> Arrived -> Idle. Not thread-safe; callers
// feed it one event at a time.
class NavigationStateMachine {
public:
    explicit NavigationStateMachine(const GuidanceConfig &cfg);

    // Replaces any active session. Throws InvalidInputError for an empty route.
    std::vector<SessionEvent> start(const Route &route);

    // Malformed updates are discarded and produce no events.
    std::vector<SessionEvent> onPositionUpdate(const PositionUpdate &update);
    std::vector<SessionEvent> onPositionError(const PositionError &error);

    // Any state -> Idle.
    std::vector<SessionEvent> clear();

    // Arrived -> Idle once the grace delay has passed.
    std::vector<SessionEvent> finish();

    std::vector<SessionEvent> repeatCurrentInstruction();

    NavState state() const { return state_; }
    const NavigationSession *session() const { return session_ ? &*session_ : nullptr; }

private:
    GuidanceConfig cfg;
    NavState state_ = NavState::Idle;
    std::optional<NavigationSession> session_;
    std::optional<RouteGeometry> geometry;

    void announce(std::vector<SessionEvent> &out, const std::string &text, bool priority, bool force);
    void transition(std::vector<SessionEvent> &out, NavState next);
};
