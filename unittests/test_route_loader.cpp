#include "route_loader.hpp"
#include "config_parser.hpp"
#include "controller.hpp"
#include "controller_provider.hpp"
#include "logger_imp.hpp"
#include "options.hpp"
#include "router.hpp"
#include "util.hpp"
#include <boost/test/unit_test.hpp>

using namespace junction;
using junction::test::request;

namespace
{
struct LoaderFixture
{
	LoaderFixture()
	{
		BuiltinControllers{}.install(controllers);
	}

	auto load(string_view text) -> Router&
	{
		opt = std::make_unique<Options>(config::parse(config::TextView{ text }));
		router = std::make_unique<Router>(lg, &controllers, Router::Settings{ opt->literals });
		load_routes(*router, *opt);
		return *router;
	}

	GlobalLogger lg;
	ControllerRegistry controllers;
	std::unique_ptr<Options> opt;
	std::unique_ptr<Router> router;
};

auto paths(const Router& r, Method m)
{
	std::vector<std::string> res;
	for (auto& route : r.routes()[m])
		res.push_back(route.path);
	return res;
}
}

BOOST_FIXTURE_TEST_SUITE(route_loader_tests, LoaderFixture)

BOOST_AUTO_TEST_CASE(same_as_registration)
{
	auto& loaded = load(
		"get / Hello::index\n"
		"group /api {\n"
		"  get /echo/{a}/{b} Echo::params\n"
		"  group /v2 {\n"
		"    post /echo/{x} Echo::params\n"
		"  }\n"
		"}\n"
		"any /ping Echo::params\n");

	Router manual{ lg, &controllers };
	manual.get("/", ControllerRef{ "Hello", "index" });
	manual.group("/api", [](Router& api) {
		api.get("/echo/{a}/{b}", ControllerRef{ "Echo", "params" });
		api.group("/v2", [](Router& v2) {
			v2.post("/echo/{x}", ControllerRef{ "Echo", "params" });
		});
	});
	manual.any("/ping", ControllerRef{ "Echo", "params" });

	BOOST_TEST(loaded.routes().size() == manual.routes().size());
	for (auto m : all_methods)
		BOOST_TEST(paths(loaded, m) == paths(manual, m), boost::test_tools::per_element());

	for (auto& req : { request("GET", "/"), request("GET", "/api/echo/1/2"),
			request("POST", "/api/v2/echo/3"), request("DELETE", "/ping"),
			request("GET", "/missing") })
		BOOST_TEST((loaded.dispatch(req) == manual.dispatch(req)));

	BOOST_TEST(loaded.dispatch(request("GET", "/api/echo/1/2")).body == "1\n2\n");
	BOOST_TEST(loaded.dispatch(request("GET", "/")).body == "It works!");
}

BOOST_AUTO_TEST_CASE(not_found_handler)
{
	auto& r = load("not_found Hello::index");
	const Response expected{ Response::Status::ok, "text/plain", "It works!" };
	BOOST_TEST((r.dispatch(request("GET", "/nothing")) == expected));
}

BOOST_AUTO_TEST_CASE(default_not_found)
{
	auto& r = load("get / Hello::index");
	BOOST_TEST((r.dispatch(request("GET", "/nothing")) == Router::default_not_found()));
}

BOOST_AUTO_TEST_CASE(literal_syntax)
{
	BOOST_TEST(load("get /a.b Hello::index").dispatch(request("GET", "/aXb")).status
		== Response::Status::not_found);
	BOOST_TEST(load("literals = verbatim\nget /a.b Hello::index")
		.dispatch(request("GET", "/aXb")).status == Response::Status::ok);
}

BOOST_AUTO_TEST_CASE(bad_route)
{
	BOOST_CHECK_THROW(load("get /{id}/{id} Hello::index"), RouteError);
}

BOOST_AUTO_TEST_SUITE_END()
