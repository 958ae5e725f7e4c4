#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/activity_record.hpp"
#include "models/competition.hpp"
#include "models/leaderboard_entry.hpp"
#include "models/scoring_mode.hpp"

#include <optional>
#include <span>
#include <vector>

namespace podium {

class team_scoring_service {
public:
	struct team_config {
		double target_distance_km{constants::scoring::default_target_km};
		std::optional<team_directory> directory; // nullopt accepts every team tag
	};

	// Aggregates team-tagged records per team, then per member:
	//  - most_distance: sum of member distance totals (km)
	//  - fastest_time: sum of member best target-distance times; a zero
	//    total always ranks last
	//  - participation: number of distinct members
	// Untagged records are ignored.
	[[nodiscard]] static auto build_team_leaderboard(std::span<const activity_record> records, scoring_mode mode, team_config config)
			-> std::expected<std::vector<team_leaderboard_entry>, type::error>;

private:
	[[nodiscard]] static auto format_team_score(double score, scoring_mode mode) -> std::string;
};

} // namespace podium
