#pragma once

#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace podium {

// score unit depends on the mode: seconds, kilometers or workout count
class leaderboard_entry {
public:
	int rank{};
	type::participant_id participant_id;
	double score{};
	std::string formatted_score;
	int qualifying_workout_count{};
	std::optional<std::string> reference_record_id; // absent for backfilled participants

	[[nodiscard]] auto operator==(const leaderboard_entry &) const -> bool = default;

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		nlohmann::json out = {{"rank", rank},
													{"participant_id", participant_id},
													{"score", score},
													{"formatted_score", formatted_score},
													{"qualifying_workout_count", qualifying_workout_count}};
		out["reference_record_id"] = reference_record_id ? nlohmann::json(*reference_record_id) : nlohmann::json(nullptr);
		return out;
	}
};

class team_leaderboard_entry {
public:
	int rank{};
	type::team_id team_id;
	std::string team_name; // empty without a team directory
	double team_score{};
	std::string formatted_score;
	int member_count{};

	[[nodiscard]] auto operator==(const team_leaderboard_entry &) const -> bool = default;

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		return {{"rank", rank},
						{"team_id", team_id},
						{"team_name", team_name},
						{"team_score", team_score},
						{"formatted_score", formatted_score},
						{"member_count", member_count}};
	}
};

} // namespace podium
