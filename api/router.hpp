#pragma once
#include "dispatcher.hpp"
#include "group_stack.hpp"
#include "handler.hpp"
#include "method.hpp"
#include "request.hpp"
#include "response.hpp"
#include "route.hpp"
#include "route_table.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <functional>
#include <optional>
#include <string>

namespace junction
{
class ControllerRegistry;
struct GlobalLogger;
struct DispatchLogger;

struct RouterSettings
{
	LiteralSyntax literals = LiteralSyntax::escaped;
};

class Router: boost::noncopyable
{
public:
	using Settings = RouterSettings;

	using GroupBody = std::function<void(Router&)>;

	// controllers may be null if no route refers to a controller
	explicit Router(GlobalLogger& lg, const ControllerRegistry* controllers = nullptr,
		Settings settings = {});

	auto get(string_view path, Handler handler) -> Router&;
	auto post(string_view path, Handler handler) -> Router&;
	auto put(string_view path, Handler handler) -> Router&;
	auto patch(string_view path, Handler handler) -> Router&;
	auto del(string_view path, Handler handler) -> Router&;
	// Same handler for every supported method
	auto any(string_view path, const Handler& handler) -> Router&;
	// An identical pattern is appended again, not replaced: the earlier
	// route keeps matching first and a warning is logged.
	// throws RouteError
	auto add(Method method, string_view path, Handler handler) -> Router&;

	// Registrations made by body get prefix prepended
	auto group(string_view prefix, const GroupBody& body) -> Router&;

	// Called with no arguments when nothing matches
	auto set_not_found_handler(Handler handler) -> Router&;

	[[nodiscard]] auto routes() const noexcept -> const RouteTable& { return table; }
	[[nodiscard]] auto settings() const noexcept -> const Settings& { return opts; }

	// Match only, nothing is invoked
	[[nodiscard]] auto resolve(const Request& req) const -> DispatchResult;

	// Match and run the handler, or the not-found handler.
	// throws HandlerError
	auto dispatch(const Request& req) const -> Response;

	static auto default_not_found() -> Response;

private:
	// where: route path for messages
	auto invoke(const Handler& handler, const std::string& where, const Arguments& args,
		DispatchLogger& lg) const -> Response;
	auto not_found(DispatchLogger& lg) const -> Response;

	GlobalLogger& lg;
	const ControllerRegistry* const controllers;
	const Settings opts;
	RouteTable table;
	GroupStack groups;
	std::optional<Handler> not_found_handler;
};
}
