#include "hello.hpp"

namespace junction
{
HelloController::HelloController()
{
	expose("index", &HelloController::index);
}

auto HelloController::index() -> Response
{
	return { Response::Status::ok, "text/plain", "It works!" };
}
}
