#pragma once

#include "core/utils.hpp"
#include "models/activity_record.hpp"
#include "models/competition.hpp"
#include "services/scoring_service.hpp"

#include <filesystem>
#include <span>
#include <vector>

namespace podium {

// Reads a competition definition and its published workouts from a data directory.
class competition_store {
public:
	explicit competition_store(std::filesystem::path data_dir = ".") : data_dir_{std::move(data_dir)} {}

	[[nodiscard]] auto load_competition() const -> std::expected<competition, type::error>;

	// Missing file means no workouts yet.
	[[nodiscard]] auto load_workouts() const -> std::expected<std::vector<activity_record>, type::error>;

	[[nodiscard]] static auto group_by_participant(std::span<const activity_record> records) -> participant_records;

private:
	std::filesystem::path data_dir_;

	[[nodiscard]] auto competition_path() const -> std::filesystem::path;
	[[nodiscard]] auto workouts_path() const -> std::filesystem::path;
};

} // namespace podium
