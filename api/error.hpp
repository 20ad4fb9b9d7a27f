#pragma once
#include <stdexcept>
#include <string>

namespace junction
{
// Route handler can't be invoked: bad shape, unknown controller or action
struct HandlerError: std::runtime_error
{
	explicit HandlerError(const std::string& s):
		runtime_error("handler error: " + s) {}
};

// Path can't be compiled into a route pattern
class RouteError: public std::runtime_error
{
public:
	RouteError(const std::string& path, const std::string& s):
		runtime_error("route " + path + ": " + s),
		p{ path }
	{}

	auto path() const noexcept -> const std::string& { return p; }

private:
	const std::string p;
};

struct RegistryError: std::runtime_error
{
	explicit RegistryError(const std::string& s):
		runtime_error("controller registry: " + s) {}
};
}
