#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/activity_record.hpp"
#include "models/leaderboard_entry.hpp"
#include "models/scoring_mode.hpp"

#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace podium {

using participant_records = std::unordered_map<type::participant_id, std::vector<activity_record>>;

class scoring_service {
public:
	struct best_effort {
		std::size_t record_index{};
		type::seconds seconds{};
	};

	// Ranked individual standings. Equal scores are ordered by participant
	// id. With a roster, everyone on it appears: those without a scored
	// entry share the trailing rank. Fails only for a target distance that
	// is not a positive finite number.
	[[nodiscard]] static auto build_leaderboard(const participant_records &records,
																							scoring_mode mode,
																							double target_distance_km = constants::scoring::default_target_km,
																							std::span<const type::participant_id> roster = {})
			-> std::expected<std::vector<leaderboard_entry>, type::error>;

	// Smallest recorded distance that counts for a fastest-time target.
	[[nodiscard]] static auto qualifying_distance_meters(double target_distance_km) -> double;

	[[nodiscard]] static auto validate_target(double target_distance_km) -> std::expected<std::monostate, type::error>;

	// Per-participant arithmetic shared with team aggregation.
	[[nodiscard]] static auto total_distance_km(std::span<const activity_record> records) -> double;
	// Fastest target-distance time among `records`; the first record wins a tie.
	[[nodiscard]] static auto best_time(std::span<const activity_record> records, double target_distance_km) -> std::optional<best_effort>;

private:
	[[nodiscard]] static auto score_fastest_time(const participant_records &records, double target_distance_km) -> std::vector<leaderboard_entry>;
	[[nodiscard]] static auto score_most_distance(const participant_records &records) -> std::vector<leaderboard_entry>;
	[[nodiscard]] static auto score_participation(const participant_records &records) -> std::vector<leaderboard_entry>;
};

} // namespace podium
