#include "instructions.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

Maneuver classify_turn(double angle_deg, const InstructionConfig &cfg) {
    double a = std::fabs(angle_deg);
    bool right = angle_deg > 0;

    if (a < cfg.continue_max_deg) return Maneuver::Continue;
    if (a < cfg.slight_max_deg) return right ? Maneuver::SlightRight : Maneuver::SlightLeft;
    if (a < cfg.turn_max_deg) return right ? Maneuver::Right : Maneuver::Left;
    if (a <= cfg.sharp_max_deg) return right ? Maneuver::SharpRight : Maneuver::SharpLeft;
    return Maneuver::UTurn;
}

const char *maneuver_phrase(Maneuver m) {
    switch (m) {
        case Maneuver::Head: return "head";
        case Maneuver::Continue: return "continue";
        case Maneuver::SlightLeft: return "turn slight left";
        case Maneuver::SlightRight: return "turn slight right";
        case Maneuver::Left: return "turn left";
        case Maneuver::Right: return "turn right";
        case Maneuver::SharpLeft: return "turn sharp left";
        case Maneuver::SharpRight: return "turn sharp right";
        case Maneuver::UTurn: return "make a U-turn";
        case Maneuver::Arrive: return "arrive";
    }
    return "continue";
}

namespace {

// Instruction under construction; text is rendered once the walk is done.
struct Step {
    Maneuver maneuver;
    std::string from_road;
    std::string onto_road;
    double distance;
    double in_bearing;     // bearing arriving at the anchor
    double out_bearing;    // bearing leaving the anchor
    size_t anchor;
};

long rounded_meters(double d) { return std::lround(d); }

std::string render(const Step &s) {
    std::ostringstream out;
    switch (s.maneuver) {
        case Maneuver::Head:
            out << "Head " << bearing_to_cardinal(s.out_bearing) << " on " << s.onto_road;
            break;
        case Maneuver::Arrive:
            out << "Continue on " << s.from_road;
            if (rounded_meters(s.distance) > 0) out << " for " << rounded_meters(s.distance) << " meters";
            out << " to arrive at your destination";
            break;
        default:
            out << "Continue on " << s.from_road << " for " << rounded_meters(s.distance)
                << " meters, then " << maneuver_phrase(s.maneuver) << " onto " << s.onto_road;
            break;
    }
    return out.str();
}

}  // namespace

InstructionSet InstructionGenerator::generate(const RoutePath &path) const {
    InstructionSet result;
    const auto &pts = path.points;
    if (pts.size() < 2) return result;

    size_t edgeCount = pts.size() - 1;
    if (path.road_names.size() != edgeCount || path.lengths.size() != edgeCount) {
        throw InvalidInputError("Route path attributes do not match its geometry");
    }

    std::vector<Step> steps;
    double first = bearing(pts[0], pts[1]);
    steps.push_back(Step{Maneuver::Head, "", path.road_names[0], 0.0, first, first, 0});

    std::string current = path.road_names[0];
    double running = path.lengths[0];
    double total = path.lengths[0];

    for (size_t i = 1; i < edgeCount; i++) {
        double in = bearing(pts[i - 1], pts[i]);
        double out = bearing(pts[i], pts[i + 1]);
        Maneuver m = classify_turn(turn_angle(in, out), cfg);
        const std::string &next = path.road_names[i];

        if (m != Maneuver::Continue || next != current) {
            if (running >= cfg.min_segment_m) {
                steps.push_back(Step{m, current, next, running, in, out, i});
                current = next;
                running = 0.0;
            } else if (steps.back().maneuver == Maneuver::Head) {
                // too short to announce: start the walk on the following edge instead
                Step &head = steps.back();
                head.onto_road = next;
                head.out_bearing = out;
                current = next;
            } else {
                // merge with the previous maneuver, measured across the short stretch
                Step &prev = steps.back();
                Maneuver combined = classify_turn(turn_angle(prev.in_bearing, out), cfg);
                if (combined == Maneuver::Continue && next == prev.from_road) {
                    running += prev.distance;
                    current = prev.from_road;
                    steps.pop_back();
                } else {
                    prev.maneuver = combined;
                    prev.onto_road = next;
                    prev.out_bearing = out;
                    current = next;
                }
            }
        }

        running += path.lengths[i];
        total += path.lengths[i];
    }

    // a final stretch too short to announce belongs to the previous leg
    if (running < cfg.min_segment_m && steps.back().maneuver != Maneuver::Head) {
        running += steps.back().distance;
        current = steps.back().from_road;
        steps.pop_back();
    }

    steps.push_back(Step{Maneuver::Arrive, current, "", running, 0.0, 0.0, edgeCount});

    result.instructions.reserve(steps.size());
    for (const auto &s : steps) {
        result.instructions.push_back(Instruction{render(s), pts[s.anchor], s.anchor, s.maneuver, s.distance});
    }
    result.total_distance_m = total;
    return result;
}

InstructionSet InstructionGenerator::arrivalOnly(const Coord &at, const std::string &road) const {
    Step arrive{Maneuver::Arrive, road, "", 0.0, 0.0, 0.0, 1};
    InstructionSet result;
    result.instructions.push_back(Instruction{render(arrive), at, arrive.anchor, arrive.maneuver, 0.0});
    return result;
}
