#include "route_loader.hpp"
#include "options.hpp"
#include "router.hpp"
#include "visitor.hpp"

namespace junction
{
namespace
{
void load_entries(Router& router, const std::vector<Options::Entry>& entries)
{
	for (auto& e : entries)
		std::visit(Visitor{
			[&router](const Options::Route& r) {
				if (r.method)
					router.add(*r.method, r.path, r.handler);
				else
					router.any(r.path, r.handler);
			},
			[&router](const Options::Group& g) {
				router.group(g.prefix, [&g](Router& r) { load_entries(r, g.entries); });
			},
		}, e);
}
}

void load_routes(Router& router, const Options& opt)
{
	load_entries(router, opt.routes);
	if (opt.not_found)
		router.set_not_found_handler(*opt.not_found);
}
}
