#pragma once

#include <cassert>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace podium {

namespace type {
// Strong type aliases
using seconds = std::int64_t;
using participant_id = std::string;
using team_id = std::string;

// Error handling
struct error {
	std::string message;

	constexpr error(std::string_view sv) : message(sv) {}

	constexpr error() = default;
	constexpr error(const error &) = default;
	constexpr error(error &&) noexcept = default;
	constexpr error &operator=(const error &) = default;
	constexpr error &operator=(error &&) noexcept = default;

	[[nodiscard]] auto what() const -> std::string_view { return message; }
};
} // namespace type

namespace util {
// Checked narrowing: asserts in debug if out of range, still returns casted value.
template <std::integral To, std::integral From>
[[nodiscard]] constexpr To narrow(From v)
{
	if (!std::in_range<To>(v)) {
		assert(!"narrow(): value out of range");
	}

	return static_cast<To>(v);
}

// Short form of an opaque id for log lines.
[[nodiscard]] inline auto short_id(std::string_view id) -> std::string { return std::string(id.substr(0, 8)); }

} // namespace util

} // namespace podium
