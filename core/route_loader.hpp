#pragma once

namespace junction
{
class Options;
class Router;

// Registers the route tree and the not-found handler of opt.
// throws RouteError
void load_routes(Router& router, const Options& opt);
}
