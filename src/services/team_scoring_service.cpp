#include "core/format.hpp"
#include "core/logging.hpp"
#include "services/rank_service.hpp"
#include "services/scoring_service.hpp"
#include "services/team_scoring_service.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace podium {

namespace {
struct member_bucket {
	type::participant_id id;
	std::vector<activity_record> records;
};

struct team_bucket {
	type::team_id id;
	std::vector<member_bucket> members;
	std::unordered_map<type::participant_id, std::size_t> member_index;

	auto add(const activity_record &r) -> void
	{
		auto [it, inserted] = member_index.try_emplace(r.participant_id, members.size());
		if (inserted) {
			members.push_back({.id = r.participant_id, .records = {}});
		}
		members[it->second].records.push_back(r);
	}
};
} // namespace

auto team_scoring_service::build_team_leaderboard(std::span<const activity_record> records, scoring_mode mode, team_config config)
		-> std::expected<std::vector<team_leaderboard_entry>, type::error>
{
	if (auto res = scoring_service::validate_target(config.target_distance_km); !res) {
		return std::unexpected(res.error());
	}

	PODIUM_LOG_DEBUG("building " << to_string(mode) << " team leaderboard from " << records.size() << " workouts");

	// Group by team tag, then by member, in first-seen order.
	std::vector<team_bucket> teams;
	std::unordered_map<type::team_id, std::size_t> team_index;
	std::unordered_set<type::team_id> skipped;

	for (const auto &r : records) {
		if (!r.team_id || r.team_id->empty() || r.participant_id.empty()) {
			continue;
		}

		if (config.directory && !config.directory->contains(*r.team_id)) {
			if (skipped.insert(*r.team_id).second) {
				PODIUM_LOG_DEBUG("skipping unknown team " << util::short_id(*r.team_id));
			}
			continue;
		}

		auto [it, inserted] = team_index.try_emplace(*r.team_id, teams.size());
		if (inserted) {
			teams.push_back({.id = *r.team_id, .members = {}, .member_index = {}});
		}
		teams[it->second].add(r);
	}

	std::vector<team_leaderboard_entry> entries;
	entries.reserve(teams.size());

	for (const auto &t : teams) {
		double total = 0.0;

		switch (mode) {
		case scoring_mode::most_distance:
			for (const auto &m : t.members) {
				total += scoring_service::total_distance_km(m.records);
			}
			break;
		case scoring_mode::fastest_time:
			for (const auto &m : t.members) {
				if (auto best = scoring_service::best_time(m.records, config.target_distance_km)) {
					total += static_cast<double>(best->seconds);
				}
			}
			break;
		case scoring_mode::participation:
			total = static_cast<double>(t.members.size());
			break;
		}

		std::string name;
		if (config.directory) {
			name = config.directory->at(t.id);
		}

		entries.push_back({.rank = 0,
											 .team_id = t.id,
											 .team_name = std::move(name),
											 .team_score = total,
											 .formatted_score = format_team_score(total, mode),
											 .member_count = util::narrow<int>(t.members.size())});
	}

	if (mode == scoring_mode::fastest_time) {
		// Lower total wins, but a zero total means nothing was timed.
		std::ranges::sort(entries, [](const team_leaderboard_entry &a, const team_leaderboard_entry &b) {
			const bool a_empty = a.team_score == 0.0;
			const bool b_empty = b.team_score == 0.0;
			if (a_empty != b_empty) {
				return b_empty;
			}
			if (a.team_score != b.team_score) {
				return a.team_score < b.team_score;
			}
			return a.team_id < b.team_id;
		});
	}
	else {
		std::ranges::sort(entries, [](const team_leaderboard_entry &a, const team_leaderboard_entry &b) {
			if (a.team_score != b.team_score) {
				return a.team_score > b.team_score;
			}
			return a.team_id < b.team_id;
		});
	}

	rank_service::assign_positional(std::span{entries});

	PODIUM_LOG_DEBUG("team leaderboard: " << entries.size() << " teams ranked");
	return entries;
}

auto team_scoring_service::format_team_score(double score, scoring_mode mode) -> std::string
{
	switch (mode) {
	case scoring_mode::fastest_time:
		if (score == 0.0) {
			return std::string(constants::text::no_time);
		}
		return format::duration(static_cast<type::seconds>(score));
	case scoring_mode::most_distance:
		return format::distance_km(score);
	case scoring_mode::participation:
		return format::counted(static_cast<std::int64_t>(score), constants::text::member);
	}
	return format::fixed(score, 2);
}

} // namespace podium
