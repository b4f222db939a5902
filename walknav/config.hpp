#pragma once
#include <optional>
#include <string>
#include "nlohmann/json.hpp"
#include "geo.hpp"

struct SnapConfig {
    double max_snap_distance_m = 75.0;
    double grid_cell_deg = 0.001;
    std::optional<BoundingBox> bounds;  // graph extent + max snap distance if unset
};

struct RoutingConfig {
    double walking_speed_mps = 1.4;
};

// Turn classification by |turn angle|:
//   [0, continue_max) continue, [continue_max, slight_max) slight,
//   [slight_max, turn_max) turn, [turn_max, sharp_max] sharp, above that u-turn.
struct InstructionConfig {
    double min_segment_m = 2.0;
    double continue_max_deg = 45.0;
    double slight_max_deg = 80.0;
    double turn_max_deg = 135.0;
    double sharp_max_deg = 170.0;
};

struct GuidanceConfig {
    double proximity_lock_m = 75.0;
    double poor_accuracy_m = 100.0;
    double off_route_m = 35.0;
    double off_route_relaxed_m = 50.0;
    double relaxed_accuracy_m = 50.0;
    double advance_warning_near_m = 35.0;   // exclusive
    double advance_warning_far_m = 60.0;    // inclusive
    double advance_m = 25.0;
    double arrival_m = 15.0;
    int arrival_grace_ms = 3000;
    double tracking_snap_min_m = 50.0;
    double tracking_snap_max_m = 100.0;
    size_t max_pending_updates = 32;
};

struct SpeechConfig {
    bool enabled = true;
    int dedup_cooldown_ms = 3000;
    int max_retries = 3;
};

struct Config {
    SnapConfig snap;
    RoutingConfig routing;
    InstructionConfig instructions;
    GuidanceConfig guidance;
    SpeechConfig speech;
    std::string log_level = "info";

    static Config fromJson(const nlohmann::json &j);
    static Config fromFile(const std::string &path);

    // Throws InvalidInputError on inconsistent values.
    void validate() const;
};
