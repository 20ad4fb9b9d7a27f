#include "cmdline_parser.hpp"
#include "config_parser.hpp"
#include "controller.hpp"
#include "controller_provider.hpp"
#include "logger_imp.hpp"
#include "logs.hpp"
#include "options.hpp"
#include "parameters.hpp"
#include "route_loader.hpp"
#include "router.hpp"
#include "visitor.hpp"
#include <iostream>
#include <exception>

using namespace junction;

namespace
{
struct RequestToQuit : std::exception {};

auto make_parameters(int argc, char *argv[])
{
	const auto parser = CommandLineParser{};
	const auto cmdline = parser.parse(argc, argv);
	if (cmdline.has("help")) {
		parser.print_options(std::cerr);
		throw RequestToQuit{};
	}
	if (cmdline.has("version")) {
		std::cerr << "Junction 0.01";
		throw RequestToQuit{};
	}

	return cmdline.to_parameters();
}

void list_routes(const Router& router, std::ostream& out)
{
	for (auto m : all_methods)
		for (auto& r : router.routes()[m])
			out << m << ' ' << r.path << ' ' << r.pattern.source()
				<< ' ' << r.handler.describe() << '\n';
}

void resolve(const Router& router, const Request& req, std::ostream& out)
{
	out << effective_method(req) << ' ' << req.target << " -> ";
	std::visit(Visitor{
		[&out](const Match& m) {
			out << m.route->path << ' ' << m.route->handler.describe()
				<< ' ' << m.params << '\n';
		},
		[&out](const NotFound&) {
			out << "not found\n";
		},
	}, router.resolve(req));
}

void run(const Router& router, const Request& req, std::ostream& out)
{
	auto resp = router.dispatch(req);
	out << status_string(resp.status) << '\n';
	if (!resp.content_type.empty())
		out << "Content-Type: " << resp.content_type << '\n';
	out << '\n' << resp.body << '\n';
}
}

int main(int argc, char *argv[])
{
	try {
		auto params = make_parameters(argc, argv);

		logs::preinit();
		const auto doc = config::parse(config::File{ params.config_path });
		const Options opt{ doc };
		logs::init(opt);

		ControllerRegistry controllers;
		BuiltinControllers{}.install(controllers);

		GlobalLogger lg;
		Router router{ lg, &controllers, { opt.literals } };
		load_routes(router, opt);

		if (params.list)
			list_routes(router, std::cout);

		for (auto& target : params.targets) {
			const Request req{ params.method, target, params.method_override };
			if (params.run)
				run(router, req, std::cout);
			else
				resolve(router, req, std::cout);
		}
	} catch(RequestToQuit&) {
		// nothing to do
	} catch(std::exception &error) {
		std::cerr << argv[0] << ": " << error.what() << std::endl;
		return 1;
	}
}
