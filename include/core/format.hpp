#pragma once

#include "core/utils.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace podium::format {

// "H:MM:SS" or "M:SS" (no fixed width) to seconds. Any other shape, an empty
// segment or a non-digit character yields std::nullopt, never a zero.
[[nodiscard]] auto parse_duration(std::string_view text) -> std::optional<type::seconds>;

// Whole non-negative decimal number, digits only.
[[nodiscard]] auto parse_whole_number(std::string_view text) -> std::optional<std::int64_t>;

// Leading decimal number of `text`, the rest is ignored ("7.78mi" -> 7.78).
[[nodiscard]] auto parse_leading_number(std::string_view text) -> std::optional<double>;

// "M:SS" below one hour, "H:MM:SS" from one hour.
[[nodiscard]] auto duration(type::seconds secs) -> std::string;

// "X.XX km" below 10 km, "X.X km" from 10 km.
[[nodiscard]] auto distance_km(double km) -> std::string;

// "1 workout", "2 workouts"; singular only for exactly one.
[[nodiscard]] auto counted(std::int64_t count, std::string_view noun) -> std::string;

// Fixed-point rendering; exact halves round away from zero.
[[nodiscard]] auto fixed(double value, int digits) -> std::string;

} // namespace podium::format
