#pragma once

#include "core/utils.hpp"

#include <string_view>

namespace podium {

enum class scoring_mode {
	fastest_time,	 // lowest time at the target distance wins
	most_distance, // highest accumulated distance wins
	participation	 // everyone with a workout shares rank 1
};

// Wire names: "fastest_time", "most_distance", "participation".
[[nodiscard]] auto parse_scoring_mode(std::string_view name) -> std::expected<scoring_mode, type::error>;

[[nodiscard]] auto to_string(scoring_mode mode) -> std::string_view;

// Human description of how a mode ranks.
[[nodiscard]] auto describe(scoring_mode mode) -> std::string_view;

// Column header for the score.
[[nodiscard]] auto score_label(scoring_mode mode) -> std::string_view;

} // namespace podium
