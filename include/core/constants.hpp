#pragma once

#include <cstddef>
#include <string_view>

namespace podium::constants {

// Scoring rules
namespace scoring {
inline constexpr double default_target_km = 5.0;
inline constexpr double qualifying_ratio = 0.95; // 5% shortfall tolerance
inline constexpr double meters_per_km = 1000.0;
inline constexpr double meters_per_mile = 1609.34;
inline constexpr double coarse_distance_km = 10.0; // one decimal at or above
} // namespace scoring

// UI Text
namespace text {
inline constexpr std::string_view no_time = "--:--";
inline constexpr std::string_view km_suffix = " km";
inline constexpr std::string_view workout = "workout";
inline constexpr std::string_view member = "member";

inline constexpr std::string_view target_must_positive = "target distance must be a positive number of kilometers";
inline constexpr std::string_view unknown_scoring = "unknown scoring mode";
inline constexpr std::string_view competition_missing = "competition definition not found";
} // namespace text

// Workout event tags
namespace tags {
inline constexpr std::string_view split = "split";
inline constexpr std::string_view team = "team";
inline constexpr std::string_view distance = "distance";
inline constexpr std::string_view duration = "duration";

inline constexpr std::string_view unit_km = "km";
inline constexpr std::string_view unit_mile = "mi";
} // namespace tags

// File paths
namespace files {
inline constexpr std::string_view competition_file = "competition.json";
inline constexpr std::string_view workouts_file = "workouts.json";
} // namespace files

// Environment
namespace env {
inline constexpr const char *log_level = "PODIUM_LOG_LEVEL";
} // namespace env

} // namespace podium::constants
