#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace podium {

// error: the requested operation failed
// warn: degraded input, fallback or skipped data
// info: lifecycle summaries
// debug: per-participant traces
enum class log_level { error = 0, warn = 1, info = 2, debug = 3 };

auto set_log_level(log_level level) -> void;
[[nodiscard]] auto get_log_level() -> log_level;

// Reads PODIUM_LOG_LEVEL ("error", "warn", "info", "debug"); unset or unknown keeps the current level.
auto set_log_level_from_env() -> void;

[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;
[[nodiscard]] auto to_string(log_level level) -> std::string_view;

[[nodiscard]] inline auto should_log(log_level level) -> bool { return static_cast<int>(level) <= static_cast<int>(get_log_level()); }

auto write_log(log_level level, const std::string &message) -> void;

} // namespace podium

#define PODIUM_LOG(level, message)                                                                                                                   \
	do {                                                                                                                                               \
		if (::podium::should_log(level)) {                                                                                                             \
			std::ostringstream _podium_log_stream;                                                                                                         \
			_podium_log_stream << message;                                                                                                                 \
			::podium::write_log(level, _podium_log_stream.str());                                                                                          \
		}                                                                                                                                                \
	} while (0)

#define PODIUM_LOG_ERROR(message) PODIUM_LOG(::podium::log_level::error, message)
#define PODIUM_LOG_WARN(message) PODIUM_LOG(::podium::log_level::warn, message)
#define PODIUM_LOG_INFO(message) PODIUM_LOG(::podium::log_level::info, message)
#define PODIUM_LOG_DEBUG(message) PODIUM_LOG(::podium::log_level::debug, message)
