#pragma once
#include "handler.hpp"
#include "method.hpp"
#include "params.hpp"
#include "string_view.hpp"
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace junction
{
// How the text around placeholders enters the pattern
enum class LiteralSyntax
{
	// matched as is: "/a.b" matches "/a.b" only
	escaped,
	// copied into the expression unchanged: "/a.b" also matches "/aXb"
	verbatim,
};

// Anchored expression compiled from a route path: every "{name}" matches
// one or more characters except '/'. Escaped patterns are matched without a
// regex engine, so the cost of a long segment is linear and stack bound.
class RoutePattern
{
public:
	// throws RouteError
	RoutePattern(const std::string& path, LiteralSyntax syntax);

	[[nodiscard]] auto match(string_view path) const -> std::optional<Params>;

	// ECMAScript source, "^/users/([^/]+)$"
	[[nodiscard]] auto source() const noexcept -> const std::string& { return src; }
	[[nodiscard]] auto placeholders() const -> std::vector<std::string>;

	friend auto operator==(const RoutePattern& lhs, const RoutePattern& rhs) noexcept -> bool
	{
		return lhs.src == rhs.src;
	}
	friend auto operator!=(const RoutePattern& lhs, const RoutePattern& rhs) noexcept -> bool
	{
		return !(lhs == rhs);
	}

	static constexpr string_view segment = "([^/]+)"sv;

private:
	struct Placeholder
	{
		std::string name;
		// sub-match index in re
		std::size_t group;
	};

	LiteralSyntax syntax;
	std::string src;
	std::vector<Placeholder> vars;
	// escaped: text before each placeholder, then the tail
	std::vector<std::string> literals;
	// verbatim only
	std::regex re;
};

struct Route
{
	Method method;
	// path after group prefixes and normalization
	std::string path;
	RoutePattern pattern;
	Handler handler;
};

// "" -> "/", "users" -> "/users"
auto normalize_path(std::string path) -> std::string;
}
