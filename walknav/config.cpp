#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

Config Config::fromJson(const json &j) {
    Config c;

    if (j.contains("snap")) {
        const auto &js = j["snap"];
        c.snap.max_snap_distance_m = js.value("max_snap_distance_m", c.snap.max_snap_distance_m);
        c.snap.grid_cell_deg = js.value("grid_cell_deg", c.snap.grid_cell_deg);
        if (js.contains("bounds")) {
            const auto &jb = js["bounds"];
            BoundingBox b;
            b.min_lon = jb.at("min_lon");
            b.min_lat = jb.at("min_lat");
            b.max_lon = jb.at("max_lon");
            b.max_lat = jb.at("max_lat");
            c.snap.bounds = b;
        }
    }

    if (j.contains("routing")) {
        c.routing.walking_speed_mps = j["routing"].value("walking_speed_mps", c.routing.walking_speed_mps);
    }

    if (j.contains("instructions")) {
        const auto &ji = j["instructions"];
        auto &ic = c.instructions;
        ic.min_segment_m = ji.value("min_segment_m", ic.min_segment_m);
        ic.continue_max_deg = ji.value("continue_max_deg", ic.continue_max_deg);
        ic.slight_max_deg = ji.value("slight_max_deg", ic.slight_max_deg);
        ic.turn_max_deg = ji.value("turn_max_deg", ic.turn_max_deg);
        ic.sharp_max_deg = ji.value("sharp_max_deg", ic.sharp_max_deg);
    }

    if (j.contains("guidance")) {
        const auto &jg = j["guidance"];
        auto &g = c.guidance;
        g.proximity_lock_m = jg.value("proximity_lock_m", g.proximity_lock_m);
        g.poor_accuracy_m = jg.value("poor_accuracy_m", g.poor_accuracy_m);
        g.off_route_m = jg.value("off_route_m", g.off_route_m);
        g.off_route_relaxed_m = jg.value("off_route_relaxed_m", g.off_route_relaxed_m);
        g.relaxed_accuracy_m = jg.value("relaxed_accuracy_m", g.relaxed_accuracy_m);
        g.advance_warning_near_m = jg.value("advance_warning_near_m", g.advance_warning_near_m);
        g.advance_warning_far_m = jg.value("advance_warning_far_m", g.advance_warning_far_m);
        g.advance_m = jg.value("advance_m", g.advance_m);
        g.arrival_m = jg.value("arrival_m", g.arrival_m);
        g.arrival_grace_ms = jg.value("arrival_grace_ms", g.arrival_grace_ms);
        g.tracking_snap_min_m = jg.value("tracking_snap_min_m", g.tracking_snap_min_m);
        g.tracking_snap_max_m = jg.value("tracking_snap_max_m", g.tracking_snap_max_m);
        g.max_pending_updates = jg.value("max_pending_updates", g.max_pending_updates);
    }

    if (j.contains("speech")) {
        const auto &jsp = j["speech"];
        c.speech.enabled = jsp.value("enabled", c.speech.enabled);
        c.speech.dedup_cooldown_ms = jsp.value("dedup_cooldown_ms", c.speech.dedup_cooldown_ms);
        c.speech.max_retries = jsp.value("max_retries", c.speech.max_retries);
    }

    c.log_level = j.value("log_level", c.log_level);
    c.validate();
    return c;
}

Config Config::fromFile(const std::string &path) {
    std::ifstream fin(path);
    if (!fin) {
        throw InvalidInputError("Could not open config file: " + path);
    }

    json j;
    try {
        fin >> j;
    } catch (const json::exception &e) {
        throw InvalidInputError("Error parsing config JSON: " + std::string(e.what()));
    }

    spdlog::info("[Config] loaded {}", path);
    return fromJson(j);
}

void Config::validate() const {
    if (snap.max_snap_distance_m <= 0 || snap.grid_cell_deg <= 0)
        throw InvalidInputError("snap distances must be positive");
    if (snap.bounds && (snap.bounds->min_lon > snap.bounds->max_lon ||
                        snap.bounds->min_lat > snap.bounds->max_lat))
        throw InvalidInputError("snap bounds are inverted");
    if (routing.walking_speed_mps <= 0)
        throw InvalidInputError("walking speed must be positive");

    const auto &ic = instructions;
    if (!(ic.continue_max_deg < ic.slight_max_deg && ic.slight_max_deg < ic.turn_max_deg &&
          ic.turn_max_deg < ic.sharp_max_deg && ic.sharp_max_deg < 180.0))
        throw InvalidInputError("turn classification boundaries must be increasing and below 180");

    const auto &g = guidance;
    // the warning must fire before the instruction advances
    if (g.advance_warning_near_m < g.advance_m || g.advance_warning_far_m <= g.advance_warning_near_m)
        throw InvalidInputError("advance warning band must lie beyond the advance distance");
    if (g.arrival_m <= 0 || g.advance_m <= 0 || g.off_route_m <= 0 || g.off_route_relaxed_m < g.off_route_m)
        throw InvalidInputError("guidance thresholds must be positive");
    if (g.tracking_snap_min_m > g.tracking_snap_max_m)
        throw InvalidInputError("tracking snap band is inverted");
    if (g.arrival_grace_ms < 0 || g.max_pending_updates == 0)
        throw InvalidInputError("invalid guidance timing");

    if (speech.dedup_cooldown_ms < 0 || speech.max_retries < 0)
        throw InvalidInputError("speech settings must not be negative");
}
