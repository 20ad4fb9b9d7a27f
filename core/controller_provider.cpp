#include "controller_provider.hpp"
#include "controller.hpp"
#include "modules/echo.hpp"
#include "modules/hello.hpp"

namespace junction
{
void BuiltinControllers::install(ControllerRegistry& registry)
{
	// Register all controllers you want to embed here
	registry.add<HelloController>("Hello");
	registry.add<EchoController>("Echo");
}
}
