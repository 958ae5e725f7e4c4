#pragma once

#include "core/utils.hpp"
#include "models/leaderboard_entry.hpp"

#include <concepts>
#include <span>
#include <vector>

namespace podium {

template <typename Row>
concept ranked_row = requires(Row r) {
	{ r.rank } -> std::convertible_to<int>;
};

class rank_service {
public:
	// Writes 1-based ranks by sorted position; equal scores still get
	// distinct ranks. Rows must already be in final order.
	template <ranked_row Row>
	static auto assign_positional(std::span<Row> rows) -> void
	{
		int rank = 1;
		for (auto &row : rows) {
			row.rank = rank++;
		}
	}

	// Appends a zero-score row for every roster member without an entry.
	// All of them share the rank after the last scored participant. Scored
	// rows are left untouched; roster duplicates are added once.
	static auto backfill(std::vector<leaderboard_entry> &entries, std::span<const type::participant_id> roster) -> std::size_t;
};

} // namespace podium
