#pragma once
#include <string>
#include <vector>
#include "config.hpp"
#include "geo.hpp"

enum class Maneuver {
    Head,
    Continue,
    SlightLeft,
    SlightRight,
    Left,
    Right,
    SharpLeft,
    SharpRight,
    UTurn,
    Arrive
};

struct Instruction {
    std::string text;
    Coord location;        // lies exactly on the path
    size_t path_index;     // index of location in the path
    Maneuver maneuver;
    double distance_m;     // length of the stretch the text describes, 0 for Head
};

// Path geometry plus the per-edge attributes needed for text.
// road_names[i] and lengths[i] describe the edge points[i] -> points[i + 1].
struct RoutePath {
    std::vector<Coord> points;
    std::vector<std::string> road_names;
    std::vector<double> lengths;
};

struct InstructionSet {
    std::vector<Instruction> instructions;
    double total_distance_m = 0.0;
};

// Classify a signed turn angle. Never returns Head or Arrive.
Maneuver classify_turn(double angle_deg, const InstructionConfig &cfg);

const char *maneuver_phrase(Maneuver m);

class InstructionGenerator {
public:
    explicit InstructionGenerator(const InstructionConfig &cfg) : cfg(cfg) {}

    // A path with fewer than two points yields no instructions.
    InstructionSet generate(const RoutePath &path) const;

    // Zero-length walk: a single arrival instruction anchored at path index 1
    // of the two-point path [at, at].
    InstructionSet arrivalOnly(const Coord &at, const std::string &road) const;

private:
    InstructionConfig cfg;
};
