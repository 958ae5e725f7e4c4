#include "core/constants.hpp"
#include "core/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>

namespace podium {

namespace {
std::atomic<log_level> current_level{log_level::warn};
} // namespace

auto set_log_level(log_level level) -> void { current_level.store(level, std::memory_order_relaxed); }

auto get_log_level() -> log_level { return current_level.load(std::memory_order_relaxed); }

auto set_log_level_from_env() -> void
{
	const char *value = std::getenv(constants::env::log_level);
	if (value == nullptr) {
		return;
	}

	if (auto level = parse_log_level(value)) {
		set_log_level(*level);
	}
	else {
		write_log(log_level::warn, std::string("ignoring unknown log level: ") + value);
	}
}

auto parse_log_level(std::string_view name) -> std::optional<log_level>
{
	if (name == "error") {
		return log_level::error;
	}
	if (name == "warn" || name == "warning") {
		return log_level::warn;
	}
	if (name == "info") {
		return log_level::info;
	}
	if (name == "debug") {
		return log_level::debug;
	}
	return std::nullopt;
}

auto to_string(log_level level) -> std::string_view
{
	switch (level) {
	case log_level::error:
		return "error";
	case log_level::warn:
		return "warn";
	case log_level::info:
		return "info";
	case log_level::debug:
		return "debug";
	}
	return "debug";
}

auto write_log(log_level level, const std::string &message) -> void { std::cerr << "[podium][" << to_string(level) << "] " << message << "\n"; }

} // namespace podium
