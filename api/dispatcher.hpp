#pragma once
#include "params.hpp"
#include "request.hpp"
#include "route_table.hpp"
#include "string_view.hpp"
#include <string>
#include <variant>

namespace junction
{
struct Route;

struct Match
{
	const Route* route;
	Params params;
};

struct NotFound {};

using DispatchResult = std::variant<Match, NotFound>;

// POST with a "_method" override becomes the upper-cased override
auto effective_method(const Request& req) -> std::string;

// Path component of a request target, without query and fragment
auto request_path(string_view target) noexcept -> string_view;

class Dispatcher
{
public:
	explicit Dispatcher(const RouteTable& table) noexcept: table{ table } {}

	// First route, in registration order, whose pattern matches
	[[nodiscard]] auto resolve(const Request& req) const -> DispatchResult;
	[[nodiscard]] auto resolve(string_view method, string_view path) const -> DispatchResult;

private:
	const RouteTable& table;
};
}
