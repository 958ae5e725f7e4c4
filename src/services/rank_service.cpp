#include "core/logging.hpp"
#include "services/rank_service.hpp"

#include <algorithm>
#include <unordered_set>

namespace podium {

auto rank_service::backfill(std::vector<leaderboard_entry> &entries, std::span<const type::participant_id> roster) -> std::size_t
{
	std::unordered_set<type::participant_id> present;
	for (const auto &e : entries) {
		present.insert(e.participant_id);
	}

	const auto scored = std::ranges::count_if(entries, [](const leaderboard_entry &e) { return e.qualifying_workout_count > 0; });
	const int trailing_rank = util::narrow<int>(scored) + 1;

	std::size_t added = 0;
	for (const auto &id : roster) {
		if (!present.insert(id).second) {
			continue;
		}

		entries.push_back({.rank = trailing_rank,
											 .participant_id = id,
											 .score = 0.0,
											 .formatted_score = {},
											 .qualifying_workout_count = 0,
											 .reference_record_id = std::nullopt});
		++added;
	}

	if (added > 0) {
		PODIUM_LOG_DEBUG("added " << added << " participants without workouts at rank " << trailing_rank);
	}
	return added;
}

} // namespace podium
