#include "router.hpp"
#include "controller.hpp"
#include "error.hpp"
#include "logger_imp.hpp"
#include "visitor.hpp"
#include <utility>

namespace junction
{
Router::Router(GlobalLogger& lg, const ControllerRegistry* controllers, Settings settings):
	lg{ lg },
	controllers{ controllers },
	opts{ settings }
{
}

auto Router::get(string_view path, Handler handler) -> Router&
{
	return add(Method::get, path, std::move(handler));
}

auto Router::post(string_view path, Handler handler) -> Router&
{
	return add(Method::post, path, std::move(handler));
}

auto Router::put(string_view path, Handler handler) -> Router&
{
	return add(Method::put, path, std::move(handler));
}

auto Router::patch(string_view path, Handler handler) -> Router&
{
	return add(Method::patch, path, std::move(handler));
}

auto Router::del(string_view path, Handler handler) -> Router&
{
	return add(Method::delete_, path, std::move(handler));
}

auto Router::any(string_view path, const Handler& handler) -> Router&
{
	for (auto m : all_methods)
		add(m, path, handler);
	return *this;
}

auto Router::add(Method method, string_view path, Handler handler) -> Router&
{
	auto full_path = groups.apply(path);
	RoutePattern pattern{ full_path, opts.literals };

	if (auto previous = table.find(method, pattern))
		lg.warning(method, " ", full_path, ": never matched, same pattern as ", previous->path);
	lg.trace("route ", method, " ", full_path, " -> ", handler.describe());

	table.add({ method, std::move(full_path), std::move(pattern), std::move(handler) });
	return *this;
}

auto Router::group(string_view prefix, const GroupBody& body) -> Router&
{
	GroupStack::Guard guard{ groups, prefix };
	GroupLoggerGuard lg_guard{ lg, groups.prefix() };

	if (body)
		body(*this);
	return *this;
}

auto Router::set_not_found_handler(Handler handler) -> Router&
{
	lg.trace("not found handler -> ", handler.describe());
	not_found_handler = std::move(handler);
	return *this;
}

auto Router::resolve(const Request& req) const -> DispatchResult
{
	return Dispatcher{ table }.resolve(req);
}

auto Router::dispatch(const Request& req) const -> Response
{
	const auto method = effective_method(req);
	const auto path = request_path(req.target);
	DispatchLogger dlg{ method, path };

	const auto result = Dispatcher{ table }.resolve(method, path);
	return std::visit(Visitor{
		[this, &dlg](const Match& m)
		{
			dlg.debug("matched ", m.route->path, " ", m.params);
			return invoke(m.route->handler, m.route->path, m.params.values(), dlg);
		},
		[this, &dlg](const NotFound&)
		{
			dlg.debug("no route matched");
			return not_found(dlg);
		},
	}, result);
}

auto Router::default_not_found() -> Response
{
	return {
		Response::Status::not_found,
		"application/json",
		R"({"error": "Route not found"})",
	};
}

auto Router::invoke(const Handler& handler, const std::string& where, const Arguments& args,
	DispatchLogger& dlg) const -> Response
{
	HandlerLoggerGuard guard{ dlg, handler.describe() };

	return std::visit(Visitor{
		[&where, &args](const Action& action) -> Response
		{
			if (!action)
				throw HandlerError{ where + ": invalid route handler" };
			return action(args);
		},
		[this, &where, &args, &dlg](const ControllerRef& ref) -> Response
		{
			if (!controllers)
				throw HandlerError{ where + ": no controller registry for " + ref.controller };

			auto controller = controllers->create(ref.controller);
			if (!controller)
				throw HandlerError{ where + ": controller not found: " + ref.controller };

			auto action = controller->find_action(ref.action);
			if (!action)
				throw HandlerError{ where + ": action not found: " + ref.controller + "::" + ref.action };

			dlg.trace("calling with ", args.size(), " arguments");
			return (*action)(args);
		},
	}, handler.get());
}

auto Router::not_found(DispatchLogger& dlg) const -> Response
{
	if (not_found_handler)
		return invoke(*not_found_handler, "not found handler", {}, dlg);
	return default_not_found();
}
}
