#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/scoring_mode.hpp"
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace podium {

// Registered team; records tagged with any other id are ignored when a
// directory is supplied.
struct team_info {
	type::team_id id;
	std::string name;
};

using team_directory = std::unordered_map<type::team_id, std::string>;

class competition {
public:
	std::string name;
	scoring_mode mode{scoring_mode::fastest_time};
	double target_distance_km{constants::scoring::default_target_km};
	std::vector<type::participant_id> participants;
	bool team_competition{false};
	std::vector<team_info> teams;

	[[nodiscard]] auto directory() const -> team_directory
	{
		team_directory out;
		for (const auto &t : teams) {
			out.emplace(t.id, t.name);
		}
		return out;
	}

	// Throws on a malformed document or an unknown scoring name.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> competition
	{
		competition c;
		c.name = j.value("name", std::string{});

		auto mode = parse_scoring_mode(j.at("scoring").get<std::string>());
		if (!mode) {
			throw std::invalid_argument(mode.error().message);
		}
		c.mode = *mode;

		c.target_distance_km = j.value("target_distance_km", constants::scoring::default_target_km);
		c.participants = j.value("participants", std::vector<type::participant_id>{});
		c.team_competition = j.value("team_competition", false);

		if (j.contains("teams")) {
			for (const auto &tj : j.at("teams")) {
				c.teams.push_back({.id = tj.at("id").get<std::string>(), .name = tj.value("name", std::string{})});
			}
		}
		return c;
	}
};

} // namespace podium
