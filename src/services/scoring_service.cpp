#include "core/constants.hpp"
#include "core/format.hpp"
#include "core/logging.hpp"
#include "services/rank_service.hpp"
#include "services/scoring_service.hpp"
#include "services/split_service.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <string>

namespace podium {

auto scoring_service::validate_target(double target_distance_km) -> std::expected<std::monostate, type::error>
{
	if (!std::isfinite(target_distance_km) || target_distance_km <= 0.0) {
		return std::unexpected(type::error{constants::text::target_must_positive});
	}
	return std::monostate{};
}

auto scoring_service::qualifying_distance_meters(double target_distance_km) -> double
{
	return target_distance_km * constants::scoring::meters_per_km * constants::scoring::qualifying_ratio;
}

auto scoring_service::total_distance_km(std::span<const activity_record> records) -> double
{
	double meters = 0.0;
	for (const auto &r : records) {
		meters += r.distance_or_zero();
	}
	return meters / constants::scoring::meters_per_km;
}

auto scoring_service::best_time(std::span<const activity_record> records, double target_distance_km) -> std::optional<best_effort>
{
	std::optional<best_effort> best;
	for (std::size_t i = 0; i < records.size(); ++i) {
		const auto t = split_service::time_at_distance(records[i], target_distance_km);
		if (!best || t < best->seconds) {
			best = best_effort{.record_index = i, .seconds = t};
		}
	}
	return best;
}

auto scoring_service::build_leaderboard(const participant_records &records, scoring_mode mode, double target_distance_km, std::span<const type::participant_id> roster)
		-> std::expected<std::vector<leaderboard_entry>, type::error>
{
	if (auto res = validate_target(target_distance_km); !res) {
		return std::unexpected(res.error());
	}

	PODIUM_LOG_DEBUG("building " << to_string(mode) << " leaderboard: " << records.size() << " with workouts, " << roster.size()
															 << " on roster, target " << target_distance_km << " km");

	std::vector<leaderboard_entry> entries;
	switch (mode) {
	case scoring_mode::fastest_time:
		entries = score_fastest_time(records, target_distance_km);
		rank_service::assign_positional(std::span{entries});
		break;
	case scoring_mode::most_distance:
		entries = score_most_distance(records);
		rank_service::assign_positional(std::span{entries});
		break;
	case scoring_mode::participation:
		// every entry already holds rank 1
		entries = score_participation(records);
		break;
	}

	if (!roster.empty()) {
		rank_service::backfill(entries, roster);
	}

	return entries;
}

auto scoring_service::score_fastest_time(const participant_records &records, double target_distance_km) -> std::vector<leaderboard_entry>
{
	std::vector<leaderboard_entry> entries;
	const double min_meters = qualifying_distance_meters(target_distance_km);

	for (const auto &[id, workouts] : records) {
		std::vector<activity_record> qualifying;
		std::ranges::copy_if(workouts, std::back_inserter(qualifying), [min_meters](const activity_record &r) { return r.distance_or_zero() >= min_meters; });

		auto best = best_time(qualifying, target_distance_km);
		if (!best) {
			continue;
		}

		const auto &record = qualifying[best->record_index];
		if (best->seconds < record.duration_seconds) {
			PODIUM_LOG_DEBUG("using split time for " << util::short_id(id) << ": " << format::duration(best->seconds) << " (total was "
																							 << format::duration(record.duration_seconds) << ")");
		}

		entries.push_back({.rank = 0,
											 .participant_id = id,
											 .score = static_cast<double>(best->seconds),
											 .formatted_score = format::duration(best->seconds),
											 .qualifying_workout_count = util::narrow<int>(qualifying.size()),
											 .reference_record_id = record.id});
	}

	std::ranges::sort(entries, [](const leaderboard_entry &a, const leaderboard_entry &b) {
		if (a.score != b.score) {
			return a.score < b.score;
		}
		return a.participant_id < b.participant_id;
	});

	PODIUM_LOG_DEBUG("fastest time: " << entries.size() << " entries (target " << target_distance_km << " km)");
	return entries;
}

auto scoring_service::score_most_distance(const participant_records &records) -> std::vector<leaderboard_entry>
{
	std::vector<leaderboard_entry> entries;

	for (const auto &[id, workouts] : records) {
		if (workouts.empty()) {
			continue;
		}

		const double km = total_distance_km(workouts);
		if (km <= 0.0) {
			continue;
		}

		// longest single workout, first one on a tie
		const auto longest = std::ranges::max_element(workouts, std::less<>{}, &activity_record::distance_or_zero);

		entries.push_back({.rank = 0,
											 .participant_id = id,
											 .score = km,
											 .formatted_score = format::distance_km(km),
											 .qualifying_workout_count = util::narrow<int>(workouts.size()),
											 .reference_record_id = longest->id});
	}

	std::ranges::sort(entries, [](const leaderboard_entry &a, const leaderboard_entry &b) {
		if (a.score != b.score) {
			return a.score > b.score;
		}
		return a.participant_id < b.participant_id;
	});

	PODIUM_LOG_DEBUG("most distance: " << entries.size() << " entries");
	return entries;
}

auto scoring_service::score_participation(const participant_records &records) -> std::vector<leaderboard_entry>
{
	std::vector<leaderboard_entry> entries;

	for (const auto &[id, workouts] : records) {
		if (workouts.empty()) {
			continue;
		}

		const auto count = util::narrow<int>(workouts.size());
		entries.push_back({.rank = 1,
											 .participant_id = id,
											 .score = static_cast<double>(count),
											 .formatted_score = format::counted(count, constants::text::workout),
											 .qualifying_workout_count = count,
											 .reference_record_id = workouts.front().id});
	}

	// Output order only; rank stays 1 for all.
	std::ranges::sort(entries, std::less<>{}, &leaderboard_entry::participant_id);

	PODIUM_LOG_DEBUG("participation: " << entries.size() << " entries (all rank 1)");
	return entries;
}

} // namespace podium
