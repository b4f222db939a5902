#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "errors.hpp"
#include "navigation.hpp"
#include "test_util.hpp"

namespace {

const std::string OFF_ROUTE = "You are off route. Please return to the marked path.";
const std::string BACK_ON_ROUTE = "Back on route.";
const std::string ARRIVED = "You have arrived at your destination.";

// Builds a route through the routing engine so instructions are real.
Route make_route(const std::vector<RoadSegment> &roads, Coord from, Coord to) {
    RoutingEngine engine(build_graph(roads), Config{});
    return engine.calculateRoute(from, to);
}

// 400 m due east on one road, a vertex every 5 m.
Route straight_route() {
    return make_route({road("Main", line(at(0, 0), at(400, 0), 5))}, at(0, 0), at(400, 0));
}

// 200 m east on Main, then 200 m north on Second.
Route corner_route() {
    return make_route({
        road("Main", line(at(0, 0), at(200, 0), 5)),
        road("Second", line(at(200, 0), at(200, 200), 5)),
    }, at(0, 0), at(200, 200));
}

PositionUpdate fix(Coord c, double accuracy = 5.0) {
    return PositionUpdate{c.lat, c.lon, accuracy, std::nullopt};
}

std::vector<std::string> spoken(const std::vector<SessionEvent> &events) {
    std::vector<std::string> out;
    for (const auto &ev : events)
        if (ev.type == SessionEventType::Announcement) out.push_back(ev.text);
    return out;
}

bool has_event(const std::vector<SessionEvent> &events, SessionEventType type) {
    return std::any_of(events.begin(), events.end(), [&](const SessionEvent &e) { return e.type == type; });
}

// Accumulates everything the machine says.
struct Recorder {
    NavigationStateMachine &machine;
    std::vector<std::string> said;

    std::vector<SessionEvent> feed(const PositionUpdate &u) {
        auto evs = machine.onPositionUpdate(u);
        auto s = spoken(evs);
        said.insert(said.end(), s.begin(), s.end());
        return evs;
    }

    long count(const std::string &text) const { return std::count(said.begin(), said.end(), text); }
};

}  // namespace

// ============================================================================
// Test Suite: Thresholds
// ============================================================================

TEST(Thresholds, OffRouteScalesWithAccuracy) {
    GuidanceConfig cfg;
    EXPECT_DOUBLE_EQ(off_route_threshold(10, cfg), 35.0);
    EXPECT_DOUBLE_EQ(off_route_threshold(50, cfg), 35.0);
    EXPECT_DOUBLE_EQ(off_route_threshold(51, cfg), 50.0);
}

TEST(Thresholds, TrackingSnapBand) {
    GuidanceConfig cfg;
    EXPECT_DOUBLE_EQ(tracking_snap_threshold(5, cfg), 50.0);
    EXPECT_DOUBLE_EQ(tracking_snap_threshold(70, cfg), 70.0);
    EXPECT_DOUBLE_EQ(tracking_snap_threshold(400, cfg), 100.0);
}

TEST(Thresholds, ProximityAndWarningBand) {
    GuidanceConfig cfg;
    EXPECT_TRUE(can_lock_proximity(75, 100, cfg));
    EXPECT_FALSE(can_lock_proximity(76, 10, cfg));
    EXPECT_FALSE(can_lock_proximity(10, 101, cfg));

    EXPECT_FALSE(in_advance_warning_band(35.0, cfg));
    EXPECT_TRUE(in_advance_warning_band(35.1, cfg));
    EXPECT_TRUE(in_advance_warning_band(60.0, cfg));
    EXPECT_FALSE(in_advance_warning_band(60.1, cfg));
}

TEST(RouteGeometry, ProjectionAlongPath) {
    RouteGeometry geo(line(at(0, 0), at(100, 0), 10));
    EXPECT_NEAR(geo.length(), 100.0, 1e-3);

    RouteProjection p = geo.project(at(37, 12));
    EXPECT_NEAR(p.distance, 12.0, 1e-3);
    EXPECT_NEAR(p.along, 37.0, 1e-3);
    EXPECT_NEAR(geo.minVertexDistance(at(37, 0)), 3.0, 1e-3);
}

// ============================================================================
// Test Suite: NavigationStateMachine
// ============================================================================

TEST(NavigationStateMachine, StartAnnouncesSummaryThenFirstInstruction) {
    NavigationStateMachine machine{GuidanceConfig{}};
    auto evs = machine.start(straight_route());

    EXPECT_EQ(machine.state(), NavState::Guiding);
    auto s = spoken(evs);
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "Route found! 400 meters total.");
    EXPECT_EQ(s[1], "Head east on Main");
    ASSERT_EQ(evs.size(), 3u);
    EXPECT_TRUE(evs[1].priority);
    EXPECT_FALSE(evs[2].priority);
}

TEST(NavigationStateMachine, EmptyRouteRejected) {
    NavigationStateMachine machine{GuidanceConfig{}};
    EXPECT_THROW(machine.start(Route{}), InvalidInputError);
    EXPECT_EQ(machine.state(), NavState::Idle);
}

TEST(NavigationStateMachine, OffRouteAndBackOnce) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());
    Recorder rec{machine, {}};

    // too far to lock on: nothing may be announced
    rec.feed(fix(at(150, 200)));
    EXPECT_TRUE(rec.said.empty());
    EXPECT_FALSE(machine.session()->has_entered_proximity);

    auto locked = rec.feed(fix(at(150, 10)));
    EXPECT_TRUE(machine.session()->has_entered_proximity);
    EXPECT_TRUE(has_event(locked, SessionEventType::Status));
    EXPECT_EQ(machine.state(), NavState::Guiding);

    rec.feed(fix(at(150, 80)));
    EXPECT_EQ(machine.state(), NavState::OffRoute);
    EXPECT_TRUE(machine.session()->is_off_route);

    rec.feed(fix(at(150, 10)));
    EXPECT_EQ(machine.state(), NavState::Guiding);

    for (int i = 0; i < 5; i++) rec.feed(fix(at(151 + i, 10)));

    EXPECT_EQ(rec.count(OFF_ROUTE), 1);
    EXPECT_EQ(rec.count(BACK_ON_ROUTE), 1);
    EXPECT_EQ(rec.said.size(), 2u);
}

TEST(NavigationStateMachine, RepeatedOffRouteFixesDoNotRepeat) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());
    Recorder rec{machine, {}};

    rec.feed(fix(at(100, 0)));
    for (int i = 0; i < 5; i++) rec.feed(fix(at(100, 80 + i)));
    EXPECT_EQ(rec.count(OFF_ROUTE), 1);
}

TEST(NavigationStateMachine, PoorAccuracyNeverChangesRouteState) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());
    Recorder rec{machine, {}};

    rec.feed(fix(at(100, 0)));
    rec.feed(fix(at(100, 90), 150));
    EXPECT_EQ(machine.state(), NavState::Guiding);
    EXPECT_TRUE(rec.said.empty());
}

TEST(NavigationStateMachine, RelaxedThresholdForModerateAccuracy) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());
    Recorder rec{machine, {}};

    rec.feed(fix(at(100, 0)));
    rec.feed(fix(at(100, 45), 60));
    EXPECT_EQ(machine.state(), NavState::Guiding);

    rec.feed(fix(at(100, 45), 10));
    EXPECT_EQ(machine.state(), NavState::OffRoute);
}

TEST(NavigationStateMachine, NoProximityLockOnPoorFix) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());

    machine.onPositionUpdate(fix(at(100, 5), 150));
    EXPECT_FALSE(machine.session()->has_entered_proximity);
}

TEST(NavigationStateMachine, MalformedUpdateDiscarded) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());

    EXPECT_TRUE(machine.onPositionUpdate(PositionUpdate{NAN, 0.0, 5.0, std::nullopt}).empty());
    EXPECT_TRUE(machine.onPositionUpdate(PositionUpdate{0.0, 0.0, -1.0, std::nullopt}).empty());
    EXPECT_EQ(machine.state(), NavState::Guiding);
}

TEST(NavigationStateMachine, AdvanceWarningThenInstruction) {
    NavigationStateMachine machine{GuidanceConfig{}};
    Route route = corner_route();
    ASSERT_EQ(route.instructions.size(), 3u);
    machine.start(route);
    Recorder rec{machine, {}};

    rec.feed(fix(at(150, 0)));
    ASSERT_EQ(rec.said.size(), 1u);
    EXPECT_EQ(rec.said[0], "In 50 meters, " + route.instructions[1].text);
    EXPECT_TRUE(machine.session()->advance_warning_given);

    rec.feed(fix(at(160, 0)));
    EXPECT_EQ(rec.said.size(), 1u);

    rec.feed(fix(at(185, 0)));
    EXPECT_EQ(machine.session()->current_instruction_index, 1u);
    EXPECT_FALSE(machine.session()->advance_warning_given);
    EXPECT_EQ(rec.said.back(), route.instructions[1].text);
}

TEST(NavigationStateMachine, ProgressEvents) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());

    auto evs = machine.onPositionUpdate(fix(at(100, 20)));
    auto it = std::find_if(evs.begin(), evs.end(),
                           [](const SessionEvent &e) { return e.type == SessionEventType::Progress; });
    ASSERT_NE(it, evs.end());
    EXPECT_NEAR(it->progress.distance_traveled_m, 100.0, 1e-3);
    EXPECT_NEAR(it->progress.distance_remaining_m, 300.0, 1e-3);
    EXPECT_NEAR(it->progress.distance_to_route_m, 20.0, 1e-3);
    ASSERT_TRUE(it->progress.on_route_position.has_value());
    EXPECT_NEAR(haversine_distance(*it->progress.on_route_position, at(100, 0)), 0.0, 1e-3);

    auto far = machine.onPositionUpdate(fix(at(100, 70)));
    auto p = std::find_if(far.begin(), far.end(),
                          [](const SessionEvent &e) { return e.type == SessionEventType::Progress; });
    ASSERT_NE(p, far.end());
    EXPECT_FALSE(p->progress.on_route_position.has_value());
}

TEST(NavigationStateMachine, ArrivesOnce) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());
    Recorder rec{machine, {}};

    rec.feed(fix(at(300, 0)));
    auto evs = rec.feed(fix(at(395, 0)));
    EXPECT_EQ(machine.state(), NavState::Arrived);
    EXPECT_TRUE(has_event(evs, SessionEventType::Arrived));

    for (int i = 0; i < 3; i++) EXPECT_TRUE(rec.feed(fix(at(398, 0))).empty());
    EXPECT_EQ(rec.count(ARRIVED), 1);

    auto done = machine.finish();
    EXPECT_TRUE(has_event(done, SessionEventType::Finished));
    EXPECT_EQ(machine.state(), NavState::Idle);
    EXPECT_EQ(machine.session(), nullptr);
}

TEST(NavigationStateMachine, ClearCancels) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());

    auto evs = machine.clear();
    EXPECT_TRUE(has_event(evs, SessionEventType::Cancelled));
    EXPECT_EQ(machine.state(), NavState::Idle);
    EXPECT_TRUE(machine.onPositionUpdate(fix(at(10, 0))).empty());
    EXPECT_TRUE(machine.clear().empty());
}

TEST(NavigationStateMachine, PositionErrorsKeepGuiding) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());

    auto evs = machine.onPositionError({PositionErrorKind::PermissionDenied, ""});
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].type, SessionEventType::Status);
    EXPECT_EQ(evs[0].text, "Location permission denied. Please enable location access.");
    EXPECT_EQ(machine.state(), NavState::Guiding);
}

TEST(NavigationStateMachine, RepeatCurrentInstruction) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(straight_route());

    auto s = spoken(machine.repeatCurrentInstruction());
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(s[0], "Head east on Main");
}

TEST(NavigationStateMachine, CornerCutStillAdvancesAndArrives) {
    NavigationStateMachine machine{GuidanceConfig{}};
    Route route = corner_route();
    machine.start(route);
    Recorder rec{machine, {}};

    rec.feed(fix(at(150, 0)));
    rec.feed(fix(at(170, 0)));
    // neither this fix nor the next comes within 25 m of the turn anchor
    rec.feed(fix(at(200, 30)));
    EXPECT_EQ(machine.state(), NavState::Guiding);
    EXPECT_EQ(machine.session()->current_instruction_index, 1u);
    EXPECT_EQ(rec.count(route.instructions[1].text), 1);

    for (double y : {100.0, 150.0, 190.0}) rec.feed(fix(at(200, y)));
    EXPECT_EQ(machine.state(), NavState::Arrived);
    EXPECT_EQ(rec.count(ARRIVED), 1);
}

TEST(NavigationStateMachine, ProjectionDoesNotAdvanceBeforeLock) {
    NavigationStateMachine machine{GuidanceConfig{}};
    machine.start(corner_route());

    // 150 m north of the corner: far off the path, no proximity yet
    machine.onPositionUpdate(fix(at(350, 150)));
    EXPECT_FALSE(machine.session()->has_entered_proximity);
    EXPECT_EQ(machine.session()->current_instruction_index, 0u);
}

TEST(NavigationStateMachine, ZeroLengthRouteArrivesAtOnce) {
    NavigationStateMachine machine{GuidanceConfig{}};
    Route route = make_route({road("Main", {at(0, 0), at(100, 0)})}, at(1, 0), at(2, 0));
    ASSERT_DOUBLE_EQ(route.total_distance_m, 0.0);

    auto started = spoken(machine.start(route));
    ASSERT_EQ(started.size(), 2u);
    EXPECT_EQ(started[0], "Route found! 0 meters total.");
    EXPECT_EQ(started[1], "Continue on Main to arrive at your destination");

    auto evs = machine.onPositionUpdate(fix(at(3, 0)));
    EXPECT_TRUE(has_event(evs, SessionEventType::Arrived));
    EXPECT_EQ(machine.state(), NavState::Arrived);
}
