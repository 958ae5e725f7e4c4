#include "core/logging.hpp"
#include "models/scoring_mode.hpp"
#include "services/competition_store.hpp"
#include "services/scoring_service.hpp"
#include "services/team_scoring_service.hpp"
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace podium;

int main(int argc, char **argv)
{
	if (argc != 2) {
		std::cerr << "usage: podium <data_dir>\n";
		return 1;
	}

	set_log_level_from_env();

	// Load data
	competition_store store{argv[1]};

	auto comp = store.load_competition();
	if (!comp) {
		PODIUM_LOG_ERROR(comp.error().what());
		return 1;
	}

	auto workouts = store.load_workouts();
	if (!workouts) {
		PODIUM_LOG_ERROR(workouts.error().what());
		return 1;
	}

	PODIUM_LOG_INFO("loaded " << workouts->size() << " workouts for '" << comp->name << "'");

	// Individual standings
	const auto by_participant = competition_store::group_by_participant(*workouts);
	auto board = scoring_service::build_leaderboard(by_participant, comp->mode, comp->target_distance_km, comp->participants);
	if (!board) {
		PODIUM_LOG_ERROR(board.error().what());
		return 1;
	}

	nlohmann::json out;
	out["competition"] = comp->name;
	out["scoring"] = std::string(to_string(comp->mode));
	out["score_label"] = std::string(score_label(comp->mode));
	out["leaderboard"] = nlohmann::json::array();
	for (const auto &e : *board) {
		out["leaderboard"].push_back(e.to_json());
	}

	// Team standings
	if (comp->team_competition) {
		team_scoring_service::team_config config{.target_distance_km = comp->target_distance_km, .directory = std::nullopt};
		if (!comp->teams.empty()) {
			config.directory = comp->directory();
		}

		auto teams = team_scoring_service::build_team_leaderboard(*workouts, comp->mode, std::move(config));
		if (!teams) {
			PODIUM_LOG_ERROR(teams.error().what());
			return 1;
		}

		out["teams"] = nlohmann::json::array();
		for (const auto &t : *teams) {
			out["teams"].push_back(t.to_json());
		}
	}

	std::cout << out.dump(2) << "\n";
	return 0;
}
